#pragma once

#include <string>
#include <memory>
#include "codepair/constants.h"
#include "codepair/executor.h"
#include "codepair/execution_slots.h"
#include "codepair/language.h"
#include "codepair/session_store.h"

namespace codepair {

// Validates, routes and records code-execution requests
class ExecutionCoordinator {
public:
    struct Config {
        size_t max_code_size;
        ExecutionSlots::Config slots;

        Config() : max_code_size(MAX_CODE_SIZE) {}
    };

    // `sandbox` or `gateway` may be null when the deployment routes no
    // language to it
    ExecutionCoordinator(std::shared_ptr<SessionStore> sessions,
                         std::shared_ptr<ExecutionHistory> history,
                         std::shared_ptr<CodeExecutor> sandbox,
                         std::shared_ptr<CodeExecutor> gateway,
                         LanguageTable languages = LanguageTable::defaults(),
                         const Config& config = Config());

    // Checks, in order: session exists, session not expired, code non-empty,
    // code within the size ceiling, language supported. Each failure short
    // circuits with its own status. Every routed run is recorded before
    // returning; a history failure never hides the result.
    ExecutionResult submit(const std::string& session_id, const std::string& code,
                           const std::string& language);

    Route route_for(Language language) const;

    const ExecutionSlots& slots() const { return slots_; }

private:
    void record(const std::string& session_id, const std::string& code,
                Language language, const ExecutionResult& result);

    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<ExecutionHistory> history_;
    std::shared_ptr<CodeExecutor> sandbox_;
    std::shared_ptr<CodeExecutor> gateway_;
    LanguageTable languages_;
    Config config_;
    ExecutionSlots slots_;
};

} // namespace codepair
