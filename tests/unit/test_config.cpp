#include <gtest/gtest.h>
#include "codepair/config.h"
#include "codepair/event_codec.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <unistd.h>

namespace codepair {
namespace {

class ServerConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path.empty()) std::remove(path.c_str());
    }

    // Write `content` to a fresh temp file and return its path
    std::string write_config(const std::string& content) {
        char tmpl[] = "/tmp/codepair_config_XXXXXX";
        int fd = mkstemp(tmpl);
        EXPECT_GE(fd, 0);
        close(fd);
        path = tmpl;
        std::ofstream out(path);
        out << content;
        return path;
    }

    Json::Value json(const std::string& text) {
        Json::Value value;
        std::string error;
        EXPECT_TRUE(parse_json(text, value, error)) << error;
        return value;
    }

    std::string path;
};

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig config;

    EXPECT_EQ(config.port, DEFAULT_PORT);
    EXPECT_TRUE(config.node_id.empty());
    EXPECT_TRUE(config.redis_url.empty());
    EXPECT_TRUE(config.history_path.empty());
    EXPECT_EQ(config.session_ttl, std::chrono::hours(DEFAULT_SESSION_TTL_HOURS));
    EXPECT_EQ(config.coordinator.max_code_size, MAX_CODE_SIZE);
    EXPECT_EQ(config.coordinator.slots.max_concurrent, DEFAULT_MAX_CONCURRENT_EXECUTIONS);
    EXPECT_EQ(config.sandbox.isolation, IsolationMode::STRICT);
    EXPECT_EQ(config.retry.max_attempts, GATEWAY_MAX_ATTEMPTS);
}

TEST_F(ServerConfigTest, LoadsFile) {
    // Given: A config file overriding most keys
    write_config(R"({
        "port": 8080,
        "node_id": "node-7",
        "max_concurrent_executions": 8,
        "queue_timeout_ms": 2500,
        "max_code_size": 1000,
        "isolation": "best_effort",
        "sandbox_root": "/var/tmp/cp",
        "history_path": "/var/log/cp/history.jsonl",
        "redis_url": "tcp://127.0.0.1:6379",
        "session_ttl_hours": 2,
        "gateway": {"url": "http://piston:2000/api/v2", "max_attempts": 5,
                    "retry_delay_ms": 50, "run_timeout_ms": 4000}
    })");

    // When: Loaded
    ServerConfig config = ServerConfig::load(path);

    // Then: Every value lands where the components read it
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.node_id, "node-7");
    EXPECT_EQ(config.coordinator.slots.max_concurrent, 8);
    EXPECT_EQ(config.coordinator.slots.queue_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.coordinator.max_code_size, 1000u);
    EXPECT_EQ(config.sandbox.max_code_size, 1000u);
    EXPECT_EQ(config.gateway.max_code_size, 1000u);
    EXPECT_EQ(config.sandbox.isolation, IsolationMode::BEST_EFFORT);
    EXPECT_EQ(config.sandbox.root_dir, "/var/tmp/cp");
    EXPECT_EQ(config.history_path, "/var/log/cp/history.jsonl");
    EXPECT_EQ(config.redis_url, "tcp://127.0.0.1:6379");
    EXPECT_EQ(config.session_ttl, std::chrono::hours(2));
    EXPECT_EQ(config.gateway.url, "http://piston:2000/api/v2");
    EXPECT_EQ(config.retry.max_attempts, 5);
    EXPECT_EQ(config.retry.fixed_delay, std::chrono::milliseconds(50));
    EXPECT_EQ(config.gateway.run_timeout, std::chrono::milliseconds(4000));
}

TEST_F(ServerConfigTest, LanguageOverrides) {
    ServerConfig config;

    config.apply(json(R"({"languages": {"Rust": {"route": "gateway", "timeout_ms": 30000}}})"));

    const auto& rust = config.languages.at(Language::RUST);
    EXPECT_EQ(rust.route, Route::GATEWAY);
    EXPECT_EQ(rust.timeout_ms, 30000);
    EXPECT_EQ(config.languages.at(Language::GO).route, Route::LOCAL);
}

TEST_F(ServerConfigTest, ApplyKeepsUnmentionedValues) {
    ServerConfig config;
    config.port = 4000;

    config.apply(json(R"({"node_id": "x"})"));

    EXPECT_EQ(config.port, 4000);
    EXPECT_EQ(config.node_id, "x");
}

TEST_F(ServerConfigTest, RejectsBadValues) {
    ServerConfig config;

    EXPECT_THROW(config.apply(json(R"({"port": 0})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"port": "80"})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"max_concurrent_executions": 0})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"isolation": "none"})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"gateway": "http://x"})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"gateway": {"max_attempts": 0}})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"languages": {"cobol": {}}})")), std::runtime_error);
    EXPECT_THROW(config.apply(json(R"({"languages": {"go": {"route": "moon"}}})")),
                 std::runtime_error);
}

TEST_F(ServerConfigTest, LoadFailures) {
    EXPECT_THROW(ServerConfig::load("/nonexistent/codepair.json"), std::runtime_error);

    write_config("{ not json");
    EXPECT_THROW(ServerConfig::load(path), std::runtime_error);

    write_config("[1, 2]");
    EXPECT_THROW(ServerConfig::load(path), std::runtime_error);
}

TEST_F(ServerConfigTest, UnrunnableLanguagesFallBackToGateway) {
    // Given: A gateway, Go pinned local in the file, and a host with only Python
    ServerConfig config;
    config.apply(json(R"({"gateway": {"url": "https://exec.test"},
                          "languages": {"go": {"route": "local"}}})"));

    // When: Routes are resolved at startup
    auto moved = config.fall_back_to_gateway(
        [](Language language) { return language == Language::PYTHON; });

    // Then: Everything else with a remote mapping moves, the pinned route stays
    EXPECT_EQ(config.languages.at(Language::PYTHON).route, Route::LOCAL);
    EXPECT_EQ(config.languages.at(Language::GO).route, Route::LOCAL);
    EXPECT_EQ(config.languages.at(Language::RUST).route, Route::GATEWAY);
    EXPECT_EQ(config.languages.at(Language::JAVASCRIPT).route, Route::GATEWAY);
    EXPECT_EQ(moved.size(), config.languages.languages().size() - 2);
    EXPECT_EQ(std::count(moved.begin(), moved.end(), Language::GO), 0);
}

TEST_F(ServerConfigTest, NoFallbackWithoutGateway) {
    ServerConfig config;

    auto moved = config.fall_back_to_gateway([](Language) { return false; });

    EXPECT_TRUE(moved.empty());
    EXPECT_EQ(config.languages.at(Language::RUST).route, Route::LOCAL);
}

TEST_F(ServerConfigTest, IsolationNames) {
    EXPECT_EQ(parse_isolation("strict").value_or(IsolationMode::BEST_EFFORT), IsolationMode::STRICT);
    EXPECT_EQ(parse_isolation("best_effort").value_or(IsolationMode::STRICT), IsolationMode::BEST_EFFORT);
    EXPECT_FALSE(parse_isolation("STRICT").has_value());
    EXPECT_EQ(isolation_name(IsolationMode::BEST_EFFORT), "best_effort");
}

} // namespace
} // namespace codepair
