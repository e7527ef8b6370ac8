#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace codepair {

enum class ExecutionStatus {
    SUCCESS,              // exit code 0
    NON_ZERO_EXIT,        // the candidate's program failed; a normal outcome
    TIMED_OUT,            // killed at the wall-clock deadline
    PROVISIONING_FAILED,  // could not stand up the sandbox
    REJECTED_INPUT,       // empty, oversized or unsupported request
    GATEWAY_UNAVAILABLE,  // remote service failed after its bounded retries
    SESSION_NOT_FOUND,
    SESSION_EXPIRED,
    CAPACITY_EXCEEDED     // no execution slot freed within the queue timeout
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    std::optional<std::string> output;
    std::optional<std::string> error;
    int exit_code = 0;
    std::chrono::milliseconds elapsed{0};
    std::string sandbox_id;               // empty when no sandbox was provisioned

    // Failure that happened before anything ran
    static ExecutionResult failure(ExecutionStatus status, const std::string& message);

    // Build a result from a finished program's streams.
    // Success keeps stdout as output and stderr as side diagnostics; a non-zero
    // exit reports stderr, falling back to stdout.
    static ExecutionResult from_exit(int exit_code, const std::string& stdout_text,
                                     const std::string& stderr_text);

    bool ran() const;
};

std::string status_name(ExecutionStatus status);

// HTTP status for the execute endpoint: 200 for every completed run
int http_status_for(ExecutionStatus status);

} // namespace codepair
