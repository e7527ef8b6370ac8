#include "codepair/coordinator.h"
#include "codepair/ids.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace codepair {

namespace {

bool is_blank(const std::string& code) {
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<SessionStore> sessions,
                                           std::shared_ptr<ExecutionHistory> history,
                                           std::shared_ptr<CodeExecutor> sandbox,
                                           std::shared_ptr<CodeExecutor> gateway,
                                           LanguageTable languages,
                                           const Config& config)
    : sessions_(std::move(sessions)),
      history_(std::move(history)),
      sandbox_(std::move(sandbox)),
      gateway_(std::move(gateway)),
      languages_(std::move(languages)),
      config_(config),
      slots_(config.slots) {}

Route ExecutionCoordinator::route_for(Language language) const {
    return languages_.at(language).route;
}

ExecutionResult ExecutionCoordinator::submit(const std::string& session_id,
                                             const std::string& code,
                                             const std::string& language_tag) {
    auto session = sessions_->find(session_id);
    if (!session) {
        return ExecutionResult::failure(ExecutionStatus::SESSION_NOT_FOUND, "Session not found");
    }
    if (session->is_expired()) {
        return ExecutionResult::failure(ExecutionStatus::SESSION_EXPIRED, "Session expired");
    }

    if (code.empty() || is_blank(code)) {
        return ExecutionResult::failure(ExecutionStatus::REJECTED_INPUT, "Code cannot be empty");
    }
    if (code_length(code) > config_.max_code_size) {
        return ExecutionResult::failure(
            ExecutionStatus::REJECTED_INPUT,
            "Code is too long (max " + std::to_string(config_.max_code_size) + " characters)");
    }

    auto language = parse_language(language_tag);
    if (!language || !languages_.find(*language)) {
        return ExecutionResult::failure(ExecutionStatus::REJECTED_INPUT,
                                        "Unsupported language: " + language_tag);
    }

    Route route = route_for(*language);
    CodeExecutor* executor = route == Route::LOCAL ? sandbox_.get() : gateway_.get();
    if (!executor) {
        return ExecutionResult::failure(
            ExecutionStatus::REJECTED_INPUT,
            "Language " + language_name(*language) + " is not available on this deployment");
    }

    auto lease = slots_.acquire();
    if (!lease) {
        std::cerr << "[Coordinator] No execution slot for session " << session_id
                  << " after " << config_.slots.queue_timeout.count() << "ms" << std::endl;
        return ExecutionResult::failure(ExecutionStatus::CAPACITY_EXCEEDED,
                                        "Execution capacity exceeded, try again shortly");
    }

    std::cout << "[Coordinator] Executing " << language_name(*language) << " code for session "
              << session_id << " via " << route_name(route) << std::endl;

    ExecutionResult result = executor->execute(code, *language);

    std::cout << "[Coordinator] Execution completed in " << result.elapsed.count()
              << "ms (" << status_name(result.status) << ")" << std::endl;

    record(session_id, code, *language, result);
    return result;
}

void ExecutionCoordinator::record(const std::string& session_id, const std::string& code,
                                  Language language, const ExecutionResult& result) {
    if (!history_) return;

    ExecutionRecord record;
    record.session_id = session_id;
    record.code = code;
    record.language = language;
    record.status = result.status;
    record.output = result.output;
    record.error = result.error;
    record.elapsed = result.elapsed;
    record.executed_at = SystemClock::now();

    try {
        record.id = random_id(12);
        history_->record(record);
    } catch (const std::exception& e) {
        std::cerr << "[Coordinator] Failed to record execution for session " << session_id
                  << ": " << e.what() << std::endl;
    }
}

} // namespace codepair
