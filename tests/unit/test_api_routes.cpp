#include <gtest/gtest.h>
#include "api_routes.h"
#include "codepair/event_codec.h"
#include <future>
#include <thread>

namespace codepair {
namespace {

class ScriptedExecutor : public CodeExecutor {
public:
    ExecutionResult execute(const std::string& code, Language) override {
        if (block) {
            gate.get_future().wait();
        }
        if (code == "fail") {
            return ExecutionResult::from_exit(1, "", "Traceback: boom");
        }
        auto result = ExecutionResult::from_exit(0, "hello\n", "");
        result.elapsed = std::chrono::milliseconds(12);
        return result;
    }

    bool block = false;
    std::promise<void> gate;
};

class NullHistory : public ExecutionHistory {
public:
    void record(const ExecutionRecord&) override {}
};

class ApiRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessions = std::make_shared<InMemorySessionStore>();
        executor = std::make_shared<ScriptedExecutor>();

        ExecutionCoordinator::Config config;
        config.slots.max_concurrent = 1;
        config.slots.queue_timeout = std::chrono::milliseconds(30);
        coordinator = std::make_unique<ExecutionCoordinator>(
            sessions, std::make_shared<NullHistory>(), executor, nullptr,
            LanguageTable::defaults(), config);
        hub = std::make_unique<PresenceHub>(sessions, nullptr, "node-1");

        register_routes(server, ApiContext{*sessions, *coordinator, *hub,
                                           std::chrono::hours(24), "best_effort"});
    }

    HttpResponse call(const std::string& method, const std::string& path,
                      const std::string& body = "") {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        return server.dispatch(req);
    }

    Json::Value json_of(const HttpResponse& resp) {
        Json::Value json;
        std::string error;
        EXPECT_TRUE(parse_json(resp.body, json, error)) << error;
        return json;
    }

    std::string create_session(const std::string& body = "") {
        auto resp = call("POST", "/sessions", body);
        EXPECT_EQ(resp.status_code, 201);
        return json_of(resp)["sessionId"].asString();
    }

    std::shared_ptr<InMemorySessionStore> sessions;
    std::shared_ptr<ScriptedExecutor> executor;
    std::unique_ptr<ExecutionCoordinator> coordinator;
    std::unique_ptr<PresenceHub> hub;
    HttpServer server{0};
};

// ============================================================================
// Sessions
// ============================================================================

TEST_F(ApiRoutesTest, CreateSessionDefaultsToJavascript) {
    std::string id = create_session();

    ASSERT_FALSE(id.empty());
    auto session = sessions->find(id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->language, Language::JAVASCRIPT);
    EXPECT_TRUE(session->expires_at.has_value());
}

TEST_F(ApiRoutesTest, CreateSessionWithLanguage) {
    std::string id = create_session(R"({"language":"Python"})");

    EXPECT_EQ(sessions->find(id)->language, Language::PYTHON);
}

TEST_F(ApiRoutesTest, CreateSessionRejectsBadInput) {
    EXPECT_EQ(call("POST", "/sessions", "{nope").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions", R"({"language":7})").status_code, 400);

    auto resp = call("POST", "/sessions", R"({"language":"cobol"})");
    EXPECT_EQ(resp.status_code, 400);
    EXPECT_EQ(json_of(resp)["error"].asString(), "Unsupported language: cobol");
    EXPECT_EQ(sessions->size(), 0u);
}

TEST_F(ApiRoutesTest, GetSession) {
    std::string id = create_session(R"({"language":"go"})");

    auto resp = call("GET", "/sessions/" + id);

    EXPECT_EQ(resp.status_code, 200);
    auto json = json_of(resp);
    EXPECT_EQ(json["id"].asString(), id);
    EXPECT_EQ(json["language"].asString(), "go");
    EXPECT_TRUE(json["createdAt"].isIntegral());
    EXPECT_TRUE(json["expiresAt"].isIntegral());
}

TEST_F(ApiRoutesTest, GetMissingAndExpiredSessions) {
    Session old;
    old.id = "old";
    old.created_at = SystemClock::now() - std::chrono::hours(48);
    old.expires_at = SystemClock::now() - std::chrono::hours(24);
    sessions->put(old);

    EXPECT_EQ(call("GET", "/sessions/missing").status_code, 404);
    EXPECT_EQ(call("GET", "/sessions/old").status_code, 410);
    EXPECT_EQ(call("GET", "/sessions/a/b").status_code, 404);
}

// ============================================================================
// Execute
// ============================================================================

TEST_F(ApiRoutesTest, ExecuteSuccessShape) {
    std::string id = create_session();

    auto resp = call("POST", "/sessions/" + id + "/execute",
                     R"J({"code":"print('hello')","language":"python"})J");

    EXPECT_EQ(resp.status_code, 200);
    auto json = json_of(resp);
    EXPECT_EQ(json["output"].asString(), "hello\n");
    EXPECT_FALSE(json.isMember("error"));
    EXPECT_EQ(json["executionTimeMs"].asInt64(), 12);
    EXPECT_EQ(json["status"].asString(), "success");
}

TEST_F(ApiRoutesTest, ProgramFailureIsStill200) {
    std::string id = create_session();

    auto resp = call("POST", "/sessions/" + id + "/execute",
                     R"({"code":"fail","language":"python"})");

    EXPECT_EQ(resp.status_code, 200);
    auto json = json_of(resp);
    EXPECT_EQ(json["error"].asString(), "Traceback: boom");
    EXPECT_EQ(json["status"].asString(), "non_zero_exit");
}

TEST_F(ApiRoutesTest, ExecuteErrorStatuses) {
    std::string id = create_session();

    EXPECT_EQ(call("POST", "/sessions/missing/execute",
                   R"({"code":"x","language":"python"})").status_code, 404);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/execute",
                   R"({"code":"","language":"python"})").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/execute",
                   R"({"language":"python"})").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/execute",
                   R"({"code":"x","language":"cobol"})").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/execute",
                   R"({"code":42,"language":"python"})").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/execute", "[").status_code, 400);
    EXPECT_EQ(call("POST", "/sessions/" + id + "/run",
                   R"({"code":"x","language":"python"})").status_code, 404);
}

TEST_F(ApiRoutesTest, BusyServerAnswers503) {
    // Given: The only execution slot is held
    std::string id = create_session();
    executor->block = true;
    auto first = std::async(std::launch::async, [&]() {
        return call("POST", "/sessions/" + id + "/execute",
                    R"J({"code":"print(1)","language":"python"})J");
    });
    while (coordinator->slots().active() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // When: Another execution arrives
    auto second = call("POST", "/sessions/" + id + "/execute",
                       R"J({"code":"print(2)","language":"python"})J");

    // Then: 503, and the first completes normally
    EXPECT_EQ(second.status_code, 503);
    EXPECT_TRUE(json_of(second).isMember("error"));
    executor->gate.set_value();
    EXPECT_EQ(first.get().status_code, 200);
}

TEST_F(ApiRoutesTest, ExecutionResponseMapping) {
    auto expired = execution_response(
        ExecutionResult::failure(ExecutionStatus::SESSION_EXPIRED, "Session expired"));
    EXPECT_EQ(expired.status_code, 410);
    EXPECT_EQ(expired.body, "{\"error\":\"Session expired\"}");

    auto timeout = execution_response(
        ExecutionResult::failure(ExecutionStatus::TIMED_OUT, "Execution timed out"));
    EXPECT_EQ(timeout.status_code, 200);
    EXPECT_EQ(json_of(timeout)["status"].asString(), "timed_out");
}

// ============================================================================
// Health
// ============================================================================

TEST_F(ApiRoutesTest, HealthReportsNodeAndLoad) {
    auto resp = call("GET", "/health");

    EXPECT_EQ(resp.status_code, 200);
    auto json = json_of(resp);
    EXPECT_EQ(json["status"].asString(), "ok");
    EXPECT_EQ(json["node"].asString(), "node-1");
    EXPECT_EQ(json["isolation"].asString(), "best_effort");
    EXPECT_EQ(json["sessions"].asUInt64(), 0u);
    EXPECT_EQ(json["activeExecutions"].asInt(), 0);
}

} // namespace
} // namespace codepair
