#include "codepair/sandbox.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/socket.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace codepair {

namespace fs = std::filesystem;

namespace {

constexpr auto DRAIN_GRACE = std::chrono::milliseconds(250);
constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

std::string substitute(std::string arg, const std::string& src,
                       const std::string& bin, const std::string& workdir) {
    const std::pair<std::string, std::string> placeholders[] = {
        {"{src}", src}, {"{bin}", bin}, {"{workdir}", workdir}
    };
    for (const auto& [key, value] : placeholders) {
        size_t pos;
        while ((pos = arg.find(key)) != std::string::npos) {
            arg.replace(pos, key.size(), value);
        }
    }
    return arg;
}

bool find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (!dir.empty() && access((dir + "/" + name).c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

// libseccomp context owned by the parent; the child only loads it
class SeccompFilter {
public:
    explicit SeccompFilter(bool allow_network) {
        ctx_ = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx_) return;

        static const int denied_syscalls[] = {
            SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
            SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
            SCMP_SYS(unshare), SCMP_SYS(setns), SCMP_SYS(reboot), SCMP_SYS(kexec_load),
            SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
            SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
            SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key),
            SCMP_SYS(userfaultfd), SCMP_SYS(acct), SCMP_SYS(settimeofday)
        };

        for (int syscall : denied_syscalls) {
            if (seccomp_rule_add(ctx_, SCMP_ACT_ERRNO(EPERM), syscall, 0) != 0) {
                release();
                return;
            }
        }

        if (!allow_network) {
            for (int family : {AF_INET, AF_INET6, AF_PACKET}) {
                if (seccomp_rule_add(ctx_, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                     SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family))) != 0) {
                    release();
                    return;
                }
            }
        }
    }

    ~SeccompFilter() { release(); }

    SeccompFilter(const SeccompFilter&) = delete;
    SeccompFilter& operator=(const SeccompFilter&) = delete;

    scmp_filter_ctx get() const { return ctx_; }

private:
    void release() {
        if (ctx_) {
            seccomp_release(ctx_);
            ctx_ = nullptr;
        }
    }

    scmp_filter_ctx ctx_ = nullptr;
};

// Everything the child needs, prepared before fork so the child only makes
// syscalls. The argv/envp pointer arrays point into the strings above them.
struct ChildPlan {
    std::vector<std::string> build_args;
    std::vector<std::string> run_args;
    std::vector<std::string> env;
    std::vector<char*> build_argv;
    std::vector<char*> run_argv;
    std::vector<char*> envp;

    std::string workspace;
    std::string workdir;
    std::string scratch;
    std::string tmpfs_options;
    std::string uid_map;
    std::string gid_map;
    std::vector<std::string> readonly_mounts;    // host submounts besides /
    std::vector<std::string> covered_dirs;       // get an empty tmpfs
    std::vector<std::string> workspace_parents;  // recreated inside the covers

    SandboxLimits limits;
    IsolationMode isolation = IsolationMode::STRICT;
    scmp_filter_ctx seccomp = nullptr;

    void finalize() {
        auto pointers = [](std::vector<std::string>& strings) {
            std::vector<char*> result;
            for (auto& s : strings) result.push_back(s.data());
            result.push_back(nullptr);
            return result;
        };
        if (!build_args.empty()) build_argv = pointers(build_args);
        run_argv = pointers(run_args);
        envp = pointers(env);
    }
};

void write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

// Report a setup failure to the parent over the status pipe
void child_fail(int status_fd, const char* what, const char* detail = nullptr) {
    const char* reason = strerror(errno);
    write_all(status_fd, what, strlen(what));
    if (detail) {
        write_all(status_fd, " ", 1);
        write_all(status_fd, detail, strlen(detail));
    }
    write_all(status_fd, ": ", 2);
    write_all(status_fd, reason, strlen(reason));
}

bool write_proc_file(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = write(fd, content.data(), content.size());
    close(fd);
    return n == static_cast<ssize_t>(content.size());
}

int namespace_flags(const SandboxLimits& limits) {
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
    if (!limits.allow_network) {
        flags |= CLONE_NEWNET;
    }
    return flags;
}

bool map_user(const ChildPlan& plan) {
    return write_proc_file("/proc/self/setgroups", "deny") &&
           write_proc_file("/proc/self/uid_map", plan.uid_map) &&
           write_proc_file("/proc/self/gid_map", plan.gid_map);
}

unsigned long preserved_mount_flags(unsigned long f_flag) {
    // Locked flags must be repeated or the remount is refused
    unsigned long flags = 0;
    if (f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (f_flag & ST_NODEV) flags |= MS_NODEV;
    if (f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (f_flag & ST_RELATIME) flags |= MS_RELATIME;
    if (!(f_flag & (ST_NOATIME | ST_RELATIME))) flags |= MS_STRICTATIME;
    return flags;
}

// False only when the mount stays writable. A mount we cannot even stat
// (another user's FUSE mount) is unreachable for the program as well.
bool remount_readonly(const char* path) {
    struct statvfs st;
    if (statvfs(path, &st) != 0) {
        return errno == EACCES || errno == ENOENT;
    }
    if (st.f_flag & ST_RDONLY) return true;
    unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY | preserved_mount_flags(st.f_flag);
    return mount(nullptr, path, nullptr, flags, nullptr) == 0;
}

// Runs as init of the new PID namespace. Gives the program a private view of
// the host: every host mount read-only, the shared temp areas and the sandbox
// root replaced by empty tmpfs, this run's workspace bound back writable and a
// /proc that only shows this namespace. Returns true when every step worked;
// strict mode reports the first failure and stops, best effort keeps going.
bool prepare_filesystem(const ChildPlan& plan, int status_fd) {
    const bool strict = plan.isolation == IsolationMode::STRICT;
    bool isolated = true;
    auto step = [&](bool ok, const char* what, const char* detail) {
        if (ok) return true;
        isolated = false;
        if (strict) child_fail(status_fd, what, detail);
        return !strict;
    };

    const char* workspace = plan.workspace.c_str();

    if (!step(mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0,
              "Failed to make mounts private", nullptr)) {
        return false;
    }

    // Own mount, so it stays writable when its host mount goes read-only
    if (!step(mount(workspace, workspace, nullptr, MS_BIND, nullptr) == 0,
              "Failed to bind workspace", nullptr)) {
        return false;
    }
    int workspace_fd = open(workspace, O_PATH | O_DIRECTORY | O_CLOEXEC);
    if (!step(workspace_fd >= 0, "Failed to open workspace", nullptr)) {
        return false;
    }

    if (!step(remount_readonly("/"), "Failed to remount read-only:", "/")) {
        return false;
    }
    for (const auto& mount_point : plan.readonly_mounts) {
        if (!step(remount_readonly(mount_point.c_str()), "Failed to remount read-only:",
                  mount_point.c_str())) {
            return false;
        }
    }

    if (workspace_fd >= 0) {
        for (const auto& dir : plan.covered_dirs) {
            if (!step(mount("tmpfs", dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                            "size=16m,mode=1777") == 0,
                      "Failed to cover", dir.c_str())) {
                return false;
            }
        }
        for (const auto& dir : plan.workspace_parents) {
            if (!step(mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST,
                      "Failed to recreate", dir.c_str())) {
                return false;
            }
        }

        char source[64];
        snprintf(source, sizeof(source), "/proc/self/fd/%d", workspace_fd);
        if (!step(mount(source, workspace, nullptr, MS_BIND, nullptr) == 0,
                  "Failed to restore workspace", nullptr)) {
            return false;
        }
        close(workspace_fd);
    }

    if (!step(mount("tmpfs", plan.scratch.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                    plan.tmpfs_options.c_str()) == 0,
              "Failed to mount scratch tmpfs", nullptr)) {
        return false;
    }

    if (!step(mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) == 0,
              "Failed to mount private /proc", nullptr)) {
        return false;
    }

    return isolated;
}

template <typename Resource>
bool set_limit(Resource resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

bool apply_limits(const SandboxLimits& limits, bool isolated) {
    // RLIMIT_DATA rather than RLIMIT_AS: JIT runtimes reserve large
    // PROT_NONE regions that never become resident
    if (!set_limit(RLIMIT_DATA, limits.memory_limit_bytes)) return false;
    if (!set_limit(RLIMIT_CPU, static_cast<rlim_t>(limits.cpu_seconds))) return false;
    if (!set_limit(RLIMIT_FSIZE, limits.max_file_size_bytes)) return false;
    if (!set_limit(RLIMIT_NOFILE, static_cast<rlim_t>(limits.max_open_files))) return false;
    if (!set_limit(RLIMIT_CORE, 0)) return false;

    // Process counts are per user; only meaningful inside our own user namespace
    if (isolated && !set_limit(RLIMIT_NPROC, static_cast<rlim_t>(limits.max_processes))) {
        return false;
    }

    errno = 0;
    if (setpriority(PRIO_PROCESS, 0, limits.nice) != 0 && errno != 0) return false;
    return true;
}

void close_inherited_fds(int keep_fd) {
    struct rlimit limit;
    rlim_t max_fd = 4096;
    if (getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        max_fd = std::min<rlim_t>(limit.rlim_cur, 65536);
    }
    for (int fd = 3; fd < static_cast<int>(max_fd); ++fd) {
        if (fd != keep_fd) close(fd);
    }
}

// The process that created the namespaces waits for their init and exits
// the same way, so the parent sees the program's own status
[[noreturn]] void relay_exit(pid_t init) {
    int status = 0;
    while (waitpid(init, &status, 0) < 0) {
        if (errno != EINTR) _exit(127);
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        // Re-raising must not leave a core file behind
        if (set_limit(RLIMIT_CORE, 0)) {
            signal(sig, SIG_DFL);
            raise(sig);
        }
        _exit(128 + sig);
    }
    _exit(WEXITSTATUS(status));
}

[[noreturn]] void run_child(const ChildPlan& plan, int stdout_fd, int stderr_fd, int status_fd) {
    setpgid(0, 0);

    // The server blocks its shutdown signals and ignores SIGPIPE; both would
    // survive exec
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 || dup2(stderr_fd, STDERR_FILENO) < 0) {
        child_fail(status_fd, "Failed to redirect standard streams");
        _exit(127);
    }
    close_inherited_fds(status_fd);

    const bool strict = plan.isolation == IsolationMode::STRICT;
    bool isolated = unshare(namespace_flags(plan.limits)) == 0;
    if (!isolated) {
        if (strict) {
            child_fail(status_fd, "Failed to create namespaces");
            _exit(127);
        }
    } else {
        if (!map_user(plan)) {
            if (strict) {
                child_fail(status_fd, "Failed to map sandbox user");
                _exit(127);
            }
            isolated = false;
        }

        // The new PID namespace only applies to children
        pid_t init = fork();
        if (init < 0) {
            child_fail(status_fd, "Failed to fork sandbox init");
            _exit(127);
        }
        if (init > 0) {
            close(status_fd);
            relay_exit(init);
        }

        if (isolated) {
            isolated = prepare_filesystem(plan, status_fd);
            if (!isolated && strict) {
                _exit(127);
            }
        }
    }

    if (chdir(plan.workdir.c_str()) != 0) {
        child_fail(status_fd, "Failed to enter workspace");
        _exit(127);
    }

    if (!apply_limits(plan.limits, isolated)) {
        child_fail(status_fd, "Failed to apply resource limits");
        _exit(127);
    }

    if (plan.seccomp && seccomp_load(plan.seccomp) != 0 && strict) {
        write_all(status_fd, "Failed to load seccomp filter", 29);
        _exit(127);
    }

    if (!plan.build_argv.empty()) {
        pid_t build = fork();
        if (build < 0) {
            child_fail(status_fd, "Failed to fork build step");
            _exit(127);
        }
        if (build == 0) {
            execvpe(plan.build_argv[0], plan.build_argv.data(), plan.envp.data());
            child_fail(status_fd, "Failed to start compiler");
            _exit(127);
        }

        int status = 0;
        while (waitpid(build, &status, 0) < 0) {
            if (errno != EINTR) {
                child_fail(status_fd, "Failed to wait for build step");
                _exit(127);
            }
        }
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            _exit(WEXITSTATUS(status));
        }
        if (WIFSIGNALED(status)) {
            // Let the parent see the same signal the compiler died of
            signal(WTERMSIG(status), SIG_DFL);
            raise(WTERMSIG(status));
            _exit(128 + WTERMSIG(status));
        }
    }

    execvpe(plan.run_argv[0], plan.run_argv.data(), plan.envp.data());
    child_fail(status_fd, "Failed to start program");
    _exit(127);
}

struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }

    void close_read() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }

    ~Pipe() {
        close_read();
        close_write();
    }
};

struct StreamBuffer {
    std::string data;
    bool open = true;
    bool truncated = false;

    void append(const char* chunk, size_t len) {
        if (data.size() >= MAX_OUTPUT_SIZE) {
            truncated = true;
            return;
        }
        size_t room = MAX_OUTPUT_SIZE - data.size();
        if (len > room) {
            truncated = true;
            len = room;
        }
        data.append(chunk, len);
    }

    std::string text() const {
        return truncated ? data + "\n[output truncated]\n" : data;
    }
};

// Kernel filesystems hold no files of other runs and mostly refuse a
// read-only bind remount inside a user namespace
bool is_pseudo_filesystem(const std::string& type) {
    static const char* const types[] = {
        "proc", "sysfs", "devpts", "mqueue", "cgroup", "cgroup2", "debugfs", "tracefs",
        "securityfs", "pstore", "bpf", "configfs", "fusectl", "binfmt_misc", "autofs",
        "efivarfs", "rpc_pipefs", "nsfs"
    };
    for (const char* t : types) {
        if (type == t) return true;
    }
    return false;
}

// mountinfo escapes space, tab, newline and backslash as \ooo
std::string unescape_mount_point(const std::string& field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::isdigit(static_cast<unsigned char>(field[i + 1]))) {
            out += static_cast<char>(std::stoi(field.substr(i + 1, 3), nullptr, 8));
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

std::vector<std::string> host_submounts() {
    std::vector<std::string> mounts;
    std::ifstream in("/proc/self/mountinfo");
    std::string line;
    while (std::getline(in, line)) {
        // id parent major:minor root mount-point options [optional...] - type source ...
        std::istringstream fields(line);
        std::string id, parent, dev, root, mount_point, token;
        fields >> id >> parent >> dev >> root >> mount_point;
        while (fields >> token && token != "-") {}
        std::string type;
        fields >> type;

        std::string path = unescape_mount_point(mount_point);
        if (path.empty() || path == "/" || is_pseudo_filesystem(type)) continue;
        if (std::find(mounts.begin(), mounts.end(), path) == mounts.end()) {
            mounts.push_back(path);
        }
    }
    return mounts;
}

bool is_within(const fs::path& path, const fs::path& dir) {
    auto p = path.begin();
    for (auto d = dir.begin(); d != dir.end(); ++d, ++p) {
        if (p == path.end() || *p != *d) return false;
    }
    return true;
}

// Decide what the child mounts so that nothing of other runs is reachable:
// every temp area and the sandbox root get covered, and the directories
// leading back down to this workspace are recreated inside the cover.
void plan_private_view(ChildPlan& plan, const fs::path& workspace) {
    plan.readonly_mounts = host_submounts();

    const fs::path candidates[] = {"/tmp", "/var/tmp", "/dev/shm", workspace.parent_path()};
    for (const auto& dir : candidates) {
        std::error_code ec;
        if (dir == "/" || !fs::is_directory(dir, ec)) continue;
        bool already = false;
        for (const auto& covered : plan.covered_dirs) {
            if (is_within(dir, covered)) already = true;
        }
        if (!already) plan.covered_dirs.push_back(dir.string());
    }

    fs::path current;
    for (const auto& part : workspace) {
        current /= part;
        for (const auto& covered : plan.covered_dirs) {
            if (is_within(current, covered) && current != fs::path(covered)) {
                plan.workspace_parents.push_back(current.string());
                break;
            }
        }
    }
}

} // namespace

SandboxLimits SandboxLimits::from(const LanguageSpec& spec) {
    SandboxLimits limits;
    limits.timeout = std::chrono::milliseconds(spec.timeout_ms);
    limits.memory_limit_bytes = spec.memory_limit_bytes;
    limits.cpu_seconds = spec.cpu_seconds;
    limits.nice = spec.nice;
    limits.scratch_bytes = spec.scratch_bytes;
    limits.max_processes = spec.max_processes;
    limits.allow_network = spec.allow_network;
    return limits;
}

// SandboxHandle implementation

SandboxHandle::SandboxHandle(std::string id, fs::path workspace)
    : id_(std::move(id)), workspace_(std::move(workspace)) {}

std::unique_ptr<SandboxHandle> SandboxHandle::provision(const std::string& root_dir) {
    fs::create_directories(root_dir);

    // Absolute and free of symlinks: the child mounts over this exact path
    std::string path_template = (fs::canonical(root_dir) / "sbx-XXXXXX").string();
    std::vector<char> buffer(path_template.begin(), path_template.end());
    buffer.push_back('\0');

    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("Failed to create sandbox workspace: " +
                                 std::string(strerror(errno)));
    }

    fs::path workspace(buffer.data());
    std::unique_ptr<SandboxHandle> handle(
        new SandboxHandle(workspace.filename().string(), workspace));

    fs::create_directory(handle->source_dir());
    fs::create_directory(handle->scratch_dir());
    return handle;
}

SandboxHandle::~SandboxHandle() {
    kill_process_group();

    std::error_code ec;
    fs::remove_all(workspace_, ec);
    if (ec) {
        std::cerr << "[Sandbox] Failed to remove workspace " << workspace_
                  << ": " << ec.message() << std::endl;
    }
}

fs::path SandboxHandle::write_source(const std::string& filename, const std::string& code) {
    fs::path path = source_dir() / filename;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create source file in " + id_);
    }
    out.write(code.data(), static_cast<std::streamsize>(code.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write source file in " + id_);
    }
    return path;
}

void SandboxHandle::claim(pid_t process_group) {
    if (used_) {
        throw std::logic_error("Sandbox handle reused: " + id_);
    }
    used_ = true;
    process_group_ = process_group;
}

void SandboxHandle::release_process_group() {
    process_group_ = -1;
}

void SandboxHandle::kill_process_group() {
    if (process_group_ > 0) {
        kill(-process_group_, SIGKILL);
    }
}

// SandboxProvisioner implementation

class SandboxProvisioner::Impl {
public:
    LanguageTable languages_;
    SandboxConfig config_;
    std::atomic<size_t> provisioned_{0};

    Impl(LanguageTable languages, const SandboxConfig& config)
        : languages_(std::move(languages)), config_(config) {}

    ExecutionResult execute(const std::string& code, Language language,
                            const SandboxLimits& limits) {
        auto start_time = std::chrono::steady_clock::now();

        if (code.empty()) {
            return ExecutionResult::failure(ExecutionStatus::REJECTED_INPUT,
                                            "Code cannot be empty");
        }
        if (code_length(code) > config_.max_code_size) {
            return ExecutionResult::failure(
                ExecutionStatus::REJECTED_INPUT,
                "Code is too long (max " + std::to_string(config_.max_code_size) + " characters)");
        }

        const LanguageSpec* spec = languages_.find(language);
        if (!spec) {
            return ExecutionResult::failure(ExecutionStatus::REJECTED_INPUT,
                                            "Unsupported language: " + language_name(language));
        }

        if (!find_executable(spec->toolchain)) {
            std::cerr << "[Sandbox] Toolchain missing for " << spec->name
                      << ": " << spec->toolchain << std::endl;
            return ExecutionResult::failure(
                ExecutionStatus::PROVISIONING_FAILED,
                "Toolchain not available for " + spec->name + ": " + spec->toolchain);
        }

        std::unique_ptr<SandboxHandle> handle;
        fs::path source_path;
        try {
            handle = SandboxHandle::provision(config_.root_dir);
            source_path = handle->write_source(spec->source_file, code);
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] Provisioning failed: " << e.what() << std::endl;
            return ExecutionResult::failure(ExecutionStatus::PROVISIONING_FAILED, e.what());
        }
        ++provisioned_;

        ExecutionResult result = run(*handle, *spec, source_path, limits);
        result.sandbox_id = handle->id();
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        handle.reset();

        std::cout << "[Sandbox] " << result.sandbox_id << " " << spec->name << " -> "
                  << status_name(result.status) << " (exit=" << result.exit_code
                  << ", " << result.elapsed.count() << "ms)" << std::endl;
        return result;
    }

private:
    ExecutionResult run(SandboxHandle& handle, const LanguageSpec& spec,
                        const fs::path& source_path, const SandboxLimits& limits) {
        ChildPlan plan;
        plan.workspace = handle.workspace().string();
        plan.workdir = handle.source_dir().string();
        plan.scratch = handle.scratch_dir().string();
        plan.limits = limits;
        plan.isolation = config_.isolation;
        plan_private_view(plan, handle.workspace());
        plan.tmpfs_options = "size=" + std::to_string(limits.scratch_bytes) + ",mode=0777";
        plan.uid_map = "0 " + std::to_string(getuid()) + " 1\n";
        plan.gid_map = "0 " + std::to_string(getgid()) + " 1\n";

        const std::string src = source_path.string();
        const std::string bin = (handle.scratch_dir() / "main").string();
        for (const auto& arg : spec.build_argv) {
            plan.build_args.push_back(substitute(arg, src, bin, plan.workdir));
        }
        for (const auto& arg : spec.run_argv) {
            plan.run_args.push_back(substitute(arg, src, bin, plan.workdir));
        }

        const char* path_env = std::getenv("PATH");
        plan.env = {
            "PATH=" + std::string(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin"),
            "HOME=" + plan.scratch,
            "TMPDIR=" + plan.scratch,
            "LANG=C.UTF-8",
            "PYTHONDONTWRITEBYTECODE=1",
            "GOCACHE=" + plan.scratch + "/go-build",
            "GOPATH=" + plan.scratch + "/go",
            "npm_config_cache=" + plan.scratch + "/npm",
            "npm_config_update_notifier=false"
        };
        plan.finalize();

        SeccompFilter filter(limits.allow_network);
        if (!filter.get() && config_.isolation == IsolationMode::STRICT) {
            return ExecutionResult::failure(ExecutionStatus::PROVISIONING_FAILED,
                                            "Failed to build seccomp filter");
        }
        plan.seccomp = filter.get();

        Pipe stdout_pipe, stderr_pipe, status_pipe;
        if (!stdout_pipe.open() || !stderr_pipe.open() || !status_pipe.open()) {
            return ExecutionResult::failure(ExecutionStatus::PROVISIONING_FAILED,
                                            "Failed to create pipes");
        }

        auto start_time = std::chrono::steady_clock::now();
        pid_t pid = fork();
        if (pid < 0) {
            return ExecutionResult::failure(ExecutionStatus::PROVISIONING_FAILED,
                                            "Failed to fork sandbox process");
        }

        if (pid == 0) {
            run_child(plan, stdout_pipe.fds[1], stderr_pipe.fds[1], status_pipe.fds[1]);
        }

        // Both sides call setpgid so the group exists before any kill
        setpgid(pid, pid);
        handle.claim(pid);

        stdout_pipe.close_write();
        stderr_pipe.close_write();
        status_pipe.close_write();

        StreamBuffer out, err, status_msg;
        const auto deadline = start_time + limits.timeout;
        std::chrono::steady_clock::time_point drain_deadline{};
        bool timed_out = false;
        bool reaped = false;
        int wait_status = 0;

        // A program may close its own streams and keep running, so the loop
        // lasts until the child is reaped or killed, not until EOF
        while (true) {
            auto now = std::chrono::steady_clock::now();

            if (!reaped && waitpid(pid, &wait_status, WNOHANG) == pid) {
                reaped = true;
                // Stragglers left in the group would hold the pipes open
                handle.kill_process_group();
                drain_deadline = now + DRAIN_GRACE;
            }

            if (!timed_out && !reaped && now >= deadline) {
                handle.kill_process_group();
                timed_out = true;
                drain_deadline = now + DRAIN_GRACE;
            }

            const bool streams_open = out.open || err.open || status_msg.open;
            if ((timed_out || reaped) && (!streams_open || now >= drain_deadline)) {
                break;
            }

            auto until = (timed_out || reaped) ? drain_deadline : deadline;
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            if (wait > POLL_SLICE) wait = POLL_SLICE;
            if (wait.count() < 1) wait = std::chrono::milliseconds(1);

            struct pollfd fds[3];
            StreamBuffer* buffers[3];
            nfds_t count = 0;
            auto watch = [&](int fd, StreamBuffer& buffer) {
                if (!buffer.open) return;
                fds[count].fd = fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                buffers[count] = &buffer;
                ++count;
            };
            watch(stdout_pipe.fds[0], out);
            watch(stderr_pipe.fds[0], err);
            watch(status_pipe.fds[0], status_msg);

            // With every stream closed this only sleeps until the next waitpid
            int ready = poll(count > 0 ? fds : nullptr, count, static_cast<int>(wait.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }

            char buffer[PIPE_BUFFER_SIZE];
            for (nfds_t i = 0; i < count; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    buffers[i]->append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    buffers[i]->open = false;
                }
            }
        }

        if (!reaped) {
            handle.kill_process_group();
            while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {}
        }
        handle.kill_process_group();
        handle.release_process_group();

        if (!status_msg.data.empty()) {
            std::cerr << "[Sandbox] " << handle.id() << " setup failed: "
                      << status_msg.data << std::endl;
            return ExecutionResult::failure(ExecutionStatus::PROVISIONING_FAILED,
                                            status_msg.data);
        }

        if (timed_out) {
            auto result = ExecutionResult::failure(
                ExecutionStatus::TIMED_OUT,
                "Execution timed out after " + std::to_string(limits.timeout.count()) + " ms");
            result.exit_code = -SIGKILL;
            return result;
        }

        if (WIFSIGNALED(wait_status)) {
            int sig = WTERMSIG(wait_status);
            if (sig == SIGXCPU) {
                auto result = ExecutionResult::failure(
                    ExecutionStatus::TIMED_OUT,
                    "Execution exceeded CPU time limit of " +
                    std::to_string(limits.cpu_seconds) + " s");
                result.exit_code = -sig;
                return result;
            }
            std::string diagnostics = err.text();
            if (diagnostics.empty()) {
                diagnostics = "Process killed by signal " + std::string(strsignal(sig));
            }
            return ExecutionResult::from_exit(128 + sig, out.text(), diagnostics);
        }

        return ExecutionResult::from_exit(WEXITSTATUS(wait_status), out.text(), err.text());
    }
};

SandboxProvisioner::SandboxProvisioner(LanguageTable languages, const SandboxConfig& config)
    : impl(std::make_unique<Impl>(std::move(languages), config)) {}

SandboxProvisioner::~SandboxProvisioner() = default;

ExecutionResult SandboxProvisioner::execute(const std::string& code, Language language) {
    const LanguageSpec* spec = impl->languages_.find(language);
    SandboxLimits limits = spec ? SandboxLimits::from(*spec) : SandboxLimits{};
    return impl->execute(code, language, limits);
}

ExecutionResult SandboxProvisioner::execute(const std::string& code, Language language,
                                            const SandboxLimits& limits) {
    return impl->execute(code, language, limits);
}

bool SandboxProvisioner::toolchain_available(Language language) const {
    const LanguageSpec* spec = impl->languages_.find(language);
    return spec && find_executable(spec->toolchain);
}

size_t SandboxProvisioner::provisioned_count() const {
    return impl->provisioned_.load();
}

bool SandboxProvisioner::probe_isolation() {
    // Same steps a strict run takes before it touches the filesystem
    ChildPlan plan;
    plan.uid_map = "0 " + std::to_string(getuid()) + " 1\n";
    plan.gid_map = "0 " + std::to_string(getgid()) + " 1\n";

    pid_t pid = fork();
    if (pid == 0) {
        if (unshare(namespace_flags(plan.limits)) != 0 || !map_user(plan)) {
            _exit(1);
        }
        pid_t init = fork();
        if (init < 0) _exit(1);
        if (init == 0) {
            bool ok = mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0 &&
                      mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
                            nullptr) == 0;
            _exit(ok ? 0 : 1);
        }
        relay_exit(init);
    } else if (pid > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return false;
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    return false;
}

} // namespace codepair
