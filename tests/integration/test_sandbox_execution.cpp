/**
 * Sandbox execution integration tests
 *
 * Run real programs through SandboxProvisioner. Isolation is best_effort so
 * the suite also passes on hosts that refuse unprivileged namespaces; tests
 * skip when a toolchain is not installed.
 */

#include <gtest/gtest.h>
#include "codepair/sandbox.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace codepair {
namespace {

namespace fs = std::filesystem;

class SandboxExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("codepair_sbx_test_" + std::to_string(getpid()));
        SandboxConfig config;
        config.root_dir = root.string();
        config.isolation = IsolationMode::BEST_EFFORT;
        provisioner = std::make_unique<SandboxProvisioner>(LanguageTable::defaults(), config);
    }

    void TearDown() override {
        provisioner.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void require(Language language) {
        if (!provisioner->toolchain_available(language)) {
            GTEST_SKIP() << language_name(language) << " toolchain not installed";
        }
    }

    size_t leftover_workspaces() const {
        if (!fs::exists(root)) return 0;
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(root)) {
            (void)entry;
            ++count;
        }
        return count;
    }

    fs::path root;
    std::unique_ptr<SandboxProvisioner> provisioner;
};

// ============================================================================
// Language runs
// ============================================================================

TEST_F(SandboxExecutionTest, RunsPython) {
    require(Language::PYTHON);
    if (HasFatalFailure() || IsSkipped()) return;

    // When: A Python program prints
    auto result = provisioner->execute("print('Hello from Python')", Language::PYTHON);

    // Then: stdout is the output
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output.value_or(""), "Hello from Python\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.sandbox_id.empty());
}

TEST_F(SandboxExecutionTest, RunsJavascript) {
    require(Language::JAVASCRIPT);
    if (IsSkipped()) return;

    auto result = provisioner->execute("console.log(6 * 7)", Language::JAVASCRIPT);

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output.value_or(""), "42\n");
}

TEST_F(SandboxExecutionTest, RuntimeErrorReportsStderr) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    auto result = provisioner->execute("print('before')\n1 / 0\n", Language::PYTHON);

    EXPECT_EQ(result.status, ExecutionStatus::NON_ZERO_EXIT);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.value_or("").find("ZeroDivisionError"), std::string::npos);
    EXPECT_EQ(result.output.value_or(""), "before\n");
}

TEST_F(SandboxExecutionTest, ExitCodePropagates) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    auto result = provisioner->execute("import sys\nsys.exit(3)\n", Language::PYTHON);

    EXPECT_EQ(result.status, ExecutionStatus::NON_ZERO_EXIT);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.error.value_or(""), "Process exited with code 3");
}

// ============================================================================
// Limits
// ============================================================================

TEST_F(SandboxExecutionTest, InfiniteLoopTimesOut) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    // Given: A short wall-clock limit
    SandboxLimits limits;
    limits.timeout = std::chrono::milliseconds(500);

    // When: The program never ends
    auto start = std::chrono::steady_clock::now();
    auto result = provisioner->execute("while True:\n    pass\n", Language::PYTHON, limits);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: Killed at the limit, not before it and not at the CPU rlimit
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_GE(result.elapsed, limits.timeout);
    EXPECT_EQ(result.error.value_or(""), "Execution timed out after 500 ms");
    EXPECT_FALSE(result.output.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(SandboxExecutionTest, BackgroundChildrenAreKilled) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    // Given: A program that leaves a sleeping child holding stdout
    auto start = std::chrono::steady_clock::now();
    auto result = provisioner->execute(
        "import subprocess\nsubprocess.Popen(['sleep', '30'])\nprint('parent done')\n",
        Language::PYTHON);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: The run ends with the parent instead of waiting for the child
    EXPECT_EQ(result.output.value_or(""), "parent done\n");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(SandboxExecutionTest, ClosingStreamsDoesNotEndTheRun) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    // Given: A program that closes stdout and stderr and keeps working
    auto start = std::chrono::steady_clock::now();
    auto result = provisioner->execute(
        "import os, time\nos.close(1)\nos.close(2)\ntime.sleep(0.3)\nos._exit(0)\n",
        Language::PYTHON);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: It runs to its own exit instead of being killed at EOF
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
}

TEST_F(SandboxExecutionTest, ClosedStreamsStillHitTheDeadline) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    SandboxLimits limits;
    limits.timeout = std::chrono::milliseconds(500);

    auto result = provisioner->execute(
        "import os\nos.close(1)\nos.close(2)\nwhile True:\n    pass\n",
        Language::PYTHON, limits);

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_GE(result.elapsed, limits.timeout);
}

TEST_F(SandboxExecutionTest, ProgramStartsWithNoBlockedSignals) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    // Given: A caller that blocks the server's shutdown signals
    sigset_t blocked, previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &blocked, &previous), 0);

    auto result = provisioner->execute(
        "import signal\nprint(len(signal.pthread_sigmask(signal.SIG_BLOCK, [])))\n",
        Language::PYTHON);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);

    // Then: The program does not inherit the mask
    EXPECT_EQ(result.output.value_or(""), "0\n") << result.error.value_or("");
}

TEST_F(SandboxExecutionTest, OversizedCodeRejectedWithoutProvisioning) {
    auto result = provisioner->execute(std::string(MAX_CODE_SIZE + 1, '#'), Language::PYTHON);

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(provisioner->provisioned_count(), 0u);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(SandboxExecutionTest, EmptyCodeRejected) {
    auto result = provisioner->execute("", Language::PYTHON);

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(provisioner->provisioned_count(), 0u);
}

// ============================================================================
// Handles
// ============================================================================

TEST_F(SandboxExecutionTest, EveryRunGetsFreshWorkspace) {
    require(Language::PYTHON);
    if (IsSkipped()) return;

    // Given: The first run leaves a file behind in its working directory
    auto first = provisioner->execute(
        "open('marker.txt', 'w').write('x')\nprint('wrote')\n", Language::PYTHON);
    auto second = provisioner->execute(
        "import os\nprint(os.path.exists('marker.txt'))\n", Language::PYTHON);

    // Then: Distinct handles, no state carried over, nothing left on disk
    EXPECT_NE(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(second.output.value_or(""), "False\n");
    EXPECT_EQ(provisioner->provisioned_count(), 2u);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(SandboxExecutionTest, RunCannotReachOtherWorkspaces) {
    require(Language::PYTHON);
    if (IsSkipped()) return;
    if (!SandboxProvisioner::probe_isolation()) {
        GTEST_SKIP() << "host does not allow unprivileged namespaces";
    }

    // Given: Another run's workspace next to ours, holding its program
    fs::path foreign = root / "sbx-foreign" / "src";
    fs::create_directories(foreign);
    std::ofstream(foreign / "main.py") << "secret = 42\n";
    fs::path leak = fs::temp_directory_path() / ("codepair_leak_" + std::to_string(getpid()));

    // When: A run goes looking for it, and writes to the shared temp area
    const std::string code =
        "import os\n"
        "try:\n"
        "    print(open('" + (foreign / "main.py").string() + "').read())\n"
        "except OSError:\n"
        "    print('hidden')\n"
        "print(len(os.listdir('" + root.string() + "')))\n"
        "try:\n"
        "    open('" + leak.string() + "', 'w').write('x')\n"
        "except OSError:\n"
        "    pass\n"
        "print(os.getpid())\n";
    auto result = provisioner->execute(code, Language::PYTHON);

    // Then: Only its own workspace is visible, temp writes stay private and
    // the program sees its own PID namespace
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output.value_or(""), "hidden\n1\n1\n");
    EXPECT_FALSE(fs::exists(leak));
    EXPECT_TRUE(fs::exists(foreign / "main.py"));
}

TEST_F(SandboxExecutionTest, HandleLifecycle) {
    std::set<std::string> ids;
    fs::path workspace;
    {
        auto handle = SandboxHandle::provision(root.string());
        workspace = handle->workspace();
        ids.insert(handle->id());

        EXPECT_TRUE(fs::is_directory(handle->source_dir()));
        EXPECT_TRUE(fs::is_directory(handle->scratch_dir()));

        auto path = handle->write_source("main.py", "print(1)");
        EXPECT_TRUE(fs::exists(path));

        handle->claim(-1);
        EXPECT_THROW(handle->claim(-1), std::logic_error);

        auto other = SandboxHandle::provision(root.string());
        ids.insert(other->id());
    }

    EXPECT_EQ(ids.size(), 2u);
    EXPECT_FALSE(fs::exists(workspace));
}

// ============================================================================
// Every language
// ============================================================================

std::string known_output_program(Language language) {
    switch (language) {
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            return "console.log('codepair-known-output');\n";
        case Language::PYTHON:
            return "print('codepair-known-output')\n";
        case Language::JAVA:
            return "public class Main {\n"
                   "    public static void main(String[] args) {\n"
                   "        System.out.println(\"codepair-known-output\");\n"
                   "    }\n"
                   "}\n";
        case Language::GO:
            return "package main\n\nimport \"fmt\"\n\n"
                   "func main() {\n\tfmt.Println(\"codepair-known-output\")\n}\n";
        case Language::RUST:
            return "fn main() {\n    println!(\"codepair-known-output\");\n}\n";
        case Language::CPP:
            return "#include <iostream>\n"
                   "int main() {\n    std::cout << \"codepair-known-output\" << std::endl;\n}\n";
    }
    return "";
}

class KnownOutputTest : public SandboxExecutionTest,
                        public ::testing::WithParamInterface<Language> {};

TEST_P(KnownOutputTest, WritesKnownStringVerbatim) {
    const Language language = GetParam();
    require(language);
    if (IsSkipped()) return;

    const LanguageSpec& spec = LanguageTable::defaults().at(language);
    if (spec.allow_network && !std::getenv("CODEPAIR_NETWORK_TESTS")) {
        GTEST_SKIP() << spec.name << " fetches its toolchain; set CODEPAIR_NETWORK_TESTS";
    }

    // Given: The language's own limits, with room for a cold toolchain cache
    SandboxLimits limits = SandboxLimits::from(spec);
    limits.timeout = std::chrono::seconds(60);
    limits.cpu_seconds = 60;

    // When: A program prints a known string
    auto result = provisioner->execute(known_output_program(language), language, limits);

    // Then: Exactly that string comes back
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error.value_or("");
    EXPECT_EQ(result.output.value_or(""), "codepair-known-output\n");
}

INSTANTIATE_TEST_SUITE_P(
    AllLanguages, KnownOutputTest,
    ::testing::ValuesIn(LanguageTable::defaults().languages()),
    [](const ::testing::TestParamInfo<Language>& info) {
        return language_name(info.param);
    });

} // namespace
} // namespace codepair
