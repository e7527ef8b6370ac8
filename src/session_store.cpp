#include "codepair/session_store.h"
#include "codepair/ids.h"
#include <json/json.h>
#include <stdexcept>

namespace codepair {

int64_t to_epoch_ms(SystemClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

// InMemorySessionStore

Session InMemorySessionStore::create(Language language, std::chrono::hours ttl) {
    Session session;
    session.id = random_id(16);
    session.language = language;
    session.created_at = SystemClock::now();
    session.expires_at = session.created_at + ttl;
    put(session);
    return session;
}

void InMemorySessionStore::put(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.id] = session;
}

std::optional<Session> InMemorySessionStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool InMemorySessionStore::update_language(const std::string& id, Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    it->second.language = language;
    return true;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// JsonlExecutionHistory

JsonlExecutionHistory::JsonlExecutionHistory(const std::string& path)
    : path_(path), out_(path, std::ios::app) {
    if (!out_) {
        throw std::runtime_error("Failed to open execution history: " + path);
    }
}

std::string JsonlExecutionHistory::to_json_line(const ExecutionRecord& record) {
    Json::Value json;
    json["id"] = record.id;
    json["sessionId"] = record.session_id;
    json["code"] = record.code;
    json["language"] = language_name(record.language);
    json["status"] = status_name(record.status);
    json["output"] = record.output ? Json::Value(*record.output) : Json::Value();
    json["error"] = record.error ? Json::Value(*record.error) : Json::Value();
    json["executionTimeMs"] = static_cast<Json::Int64>(record.elapsed.count());
    json["executedAt"] = static_cast<Json::Int64>(to_epoch_ms(record.executed_at));

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

void JsonlExecutionHistory::record(const ExecutionRecord& record) {
    std::string line = to_json_line(record);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw std::runtime_error("Failed to append to execution history: " + path_);
    }
}

} // namespace codepair
