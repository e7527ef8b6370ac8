#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>
#include <cstdint>
#include <fstream>
#include "codepair/execution_result.h"
#include "codepair/language.h"

namespace codepair {

using SystemClock = std::chrono::system_clock;

// Persistent interview session record. The core reads it, checks expiry and
// writes only the language field.
struct Session {
    std::string id;
    Language language = Language::JAVASCRIPT;
    SystemClock::time_point created_at;
    std::optional<SystemClock::time_point> expires_at;

    bool is_expired(SystemClock::time_point now = SystemClock::now()) const {
        return expires_at && *expires_at <= now;
    }
};

// Boundary to the external session store
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<Session> find(const std::string& id) = 0;

    // Returns false when the session does not exist
    virtual bool update_language(const std::string& id, Language language) = 0;
};

// Process-local store used by the server binary and tests
class InMemorySessionStore : public SessionStore {
public:
    Session create(Language language, std::chrono::hours ttl);
    void put(const Session& session);

    std::optional<Session> find(const std::string& id) override;
    bool update_language(const std::string& id, Language language) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
};

// One immutable execution record written after every routed execution
struct ExecutionRecord {
    std::string id;
    std::string session_id;
    std::string code;
    Language language = Language::JAVASCRIPT;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::chrono::milliseconds elapsed{0};
    SystemClock::time_point executed_at;
};

// Boundary to the external history store. Implementations may throw.
class ExecutionHistory {
public:
    virtual ~ExecutionHistory() = default;

    virtual void record(const ExecutionRecord& record) = 0;
};

// Append-only JSON-lines file, one record per line
class JsonlExecutionHistory : public ExecutionHistory {
public:
    // Throws std::runtime_error if the file cannot be opened
    explicit JsonlExecutionHistory(const std::string& path);

    void record(const ExecutionRecord& record) override;

    static std::string to_json_line(const ExecutionRecord& record);

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
};

// Milliseconds since the Unix epoch
int64_t to_epoch_ms(SystemClock::time_point tp);

} // namespace codepair
