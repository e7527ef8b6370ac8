#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <atomic>
#include <filesystem>
#include <sys/types.h>
#include "codepair/constants.h"
#include "codepair/executor.h"
#include "codepair/language.h"

namespace codepair {

// Strict: failing to enter namespaces is a provisioning failure.
// Best effort: fall back to rlimits + seccomp + process-group kill only
// (unprivileged development hosts).
enum class IsolationMode {
    STRICT,
    BEST_EFFORT
};

// Hard limits applied to one sandboxed run
struct SandboxLimits {
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    int cpu_seconds = DEFAULT_CPU_SECONDS;
    int nice = DEFAULT_NICE;
    size_t scratch_bytes = DEFAULT_SCRATCH_BYTES;
    size_t max_file_size_bytes = MAX_FILE_SIZE_BYTES;
    int max_processes = MAX_PROCESSES_PER_SANDBOX;
    int max_open_files = MAX_OPEN_FILES;
    bool allow_network = false;                      // Airgapped by default

    static SandboxLimits from(const LanguageSpec& spec);
};

struct SandboxConfig {
    std::string root_dir = "/tmp/codepair_sandboxes";
    IsolationMode isolation = IsolationMode::STRICT;
    size_t max_code_size = MAX_CODE_SIZE;
};

// One provisioned, single-use execution environment.
// Owns a workspace directory (src/ for the program, tmp/ for scratch) and at
// most one process group. Destruction kills the group and removes the
// workspace, whatever happened during the run.
class SandboxHandle {
public:
    // Throws std::runtime_error when the workspace cannot be created
    static std::unique_ptr<SandboxHandle> provision(const std::string& root_dir);

    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    const std::string& id() const { return id_; }
    const std::filesystem::path& workspace() const { return workspace_; }
    std::filesystem::path source_dir() const { return workspace_ / "src"; }
    std::filesystem::path scratch_dir() const { return workspace_ / "tmp"; }

    // Write the program through the filesystem API; returns its path.
    // Throws std::runtime_error on I/O failure.
    std::filesystem::path write_source(const std::string& filename, const std::string& code);

    // Claim the handle for its single run. Throws std::logic_error on reuse.
    void claim(pid_t process_group);
    void release_process_group();

    // SIGKILL the whole process group, if one is still attached
    void kill_process_group();

private:
    SandboxHandle(std::string id, std::filesystem::path workspace);

    std::string id_;
    std::filesystem::path workspace_;
    pid_t process_group_ = -1;
    bool used_ = false;
};

// Runs untrusted code, one fresh SandboxHandle per call
class SandboxProvisioner : public CodeExecutor {
public:
    explicit SandboxProvisioner(LanguageTable languages = LanguageTable::defaults(),
                                const SandboxConfig& config = SandboxConfig{});
    ~SandboxProvisioner() override;

    // Uses the language's limits from the table
    ExecutionResult execute(const std::string& code, Language language) override;

    ExecutionResult execute(const std::string& code, Language language,
                            const SandboxLimits& limits);

    // Whether this host lets an unprivileged process create namespaces
    static bool probe_isolation();

    // Whether the language's toolchain binary is on PATH
    bool toolchain_available(Language language) const;

    size_t provisioned_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace codepair
