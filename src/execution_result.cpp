#include "codepair/execution_result.h"

namespace codepair {

ExecutionResult ExecutionResult::failure(ExecutionStatus status, const std::string& message) {
    ExecutionResult result;
    result.status = status;
    result.error = message;
    result.exit_code = -1;
    return result;
}

ExecutionResult ExecutionResult::from_exit(int exit_code, const std::string& stdout_text,
                                           const std::string& stderr_text) {
    ExecutionResult result;
    result.exit_code = exit_code;

    if (!stdout_text.empty()) {
        result.output = stdout_text;
    }

    if (exit_code == 0) {
        result.status = ExecutionStatus::SUCCESS;
        if (!stderr_text.empty()) {
            result.error = stderr_text;
        }
    } else {
        result.status = ExecutionStatus::NON_ZERO_EXIT;
        if (!stderr_text.empty()) {
            result.error = stderr_text;
        } else if (!stdout_text.empty()) {
            result.error = stdout_text;
        } else {
            result.error = "Process exited with code " + std::to_string(exit_code);
        }
    }

    return result;
}

bool ExecutionResult::ran() const {
    switch (status) {
        case ExecutionStatus::SUCCESS:
        case ExecutionStatus::NON_ZERO_EXIT:
        case ExecutionStatus::TIMED_OUT:
        case ExecutionStatus::PROVISIONING_FAILED:
        case ExecutionStatus::GATEWAY_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

std::string status_name(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::NON_ZERO_EXIT: return "non_zero_exit";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
        case ExecutionStatus::PROVISIONING_FAILED: return "provisioning_failed";
        case ExecutionStatus::REJECTED_INPUT: return "rejected_input";
        case ExecutionStatus::GATEWAY_UNAVAILABLE: return "gateway_unavailable";
        case ExecutionStatus::SESSION_NOT_FOUND: return "session_not_found";
        case ExecutionStatus::SESSION_EXPIRED: return "session_expired";
        case ExecutionStatus::CAPACITY_EXCEEDED: return "capacity_exceeded";
    }
    return "unknown";
}

int http_status_for(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::REJECTED_INPUT: return 400;
        case ExecutionStatus::SESSION_NOT_FOUND: return 404;
        case ExecutionStatus::SESSION_EXPIRED: return 410;
        case ExecutionStatus::CAPACITY_EXCEEDED: return 503;
        default: return 200;
    }
}

} // namespace codepair
