#include <gtest/gtest.h>
#include "codepair/coordinator.h"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

namespace codepair {
namespace {

class FakeExecutor : public CodeExecutor {
public:
    explicit FakeExecutor(std::string name) : name_(std::move(name)) {}

    ExecutionResult execute(const std::string& code, Language language) override {
        calls++;
        last_code = code;
        last_language = language;
        if (block) {
            release.get_future().wait();
        }
        auto result = ExecutionResult::from_exit(0, name_ + " ran", "");
        result.elapsed = std::chrono::milliseconds(7);
        return result;
    }

    std::atomic<int> calls{0};
    std::string last_code;
    Language last_language = Language::JAVASCRIPT;
    bool block = false;
    std::promise<void> release;

private:
    std::string name_;
};

class RecordingHistory : public ExecutionHistory {
public:
    void record(const ExecutionRecord& record) override {
        if (fail) {
            throw std::runtime_error("history store down");
        }
        records.push_back(record);
    }

    bool fail = false;
    std::vector<ExecutionRecord> records;
};

class ExecutionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessions = std::make_shared<InMemorySessionStore>();
        history = std::make_shared<RecordingHistory>();
        sandbox = std::make_shared<FakeExecutor>("sandbox");
        gateway = std::make_shared<FakeExecutor>("gateway");

        Session live;
        live.id = "live";
        live.language = Language::PYTHON;
        live.created_at = SystemClock::now();
        live.expires_at = SystemClock::now() + std::chrono::hours(1);
        sessions->put(live);

        Session expired = live;
        expired.id = "expired";
        expired.expires_at = SystemClock::now() - std::chrono::minutes(1);
        sessions->put(expired);
    }

    std::unique_ptr<ExecutionCoordinator> make(LanguageTable table = LanguageTable::defaults(),
                                               ExecutionCoordinator::Config config =
                                                   ExecutionCoordinator::Config()) {
        return std::make_unique<ExecutionCoordinator>(sessions, history, sandbox, gateway,
                                                      table, config);
    }

    std::shared_ptr<InMemorySessionStore> sessions;
    std::shared_ptr<RecordingHistory> history;
    std::shared_ptr<FakeExecutor> sandbox;
    std::shared_ptr<FakeExecutor> gateway;
};

TEST_F(ExecutionCoordinatorTest, RunsLocalLanguageInSandbox) {
    auto coordinator = make();

    auto result = coordinator->submit("live", "print('hi')", "python");

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.output.value_or(""), "sandbox ran");
    EXPECT_EQ(sandbox->calls.load(), 1);
    EXPECT_EQ(gateway->calls.load(), 0);
    EXPECT_EQ(sandbox->last_language, Language::PYTHON);
}

TEST_F(ExecutionCoordinatorTest, LanguageIsCaseInsensitive) {
    auto coordinator = make();

    auto result = coordinator->submit("live", "console.log(1)", "JavaScript");

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(sandbox->last_language, Language::JAVASCRIPT);
}

TEST_F(ExecutionCoordinatorTest, GatewayRouteFromTable) {
    // Given: Rust routed to the remote service
    LanguageTable table = LanguageTable::defaults();
    LanguageSpec rust = table.at(Language::RUST);
    rust.route = Route::GATEWAY;
    table.set(rust);
    auto coordinator = make(table);

    auto result = coordinator->submit("live", "fn main() {}", "rust");

    EXPECT_EQ(result.output.value_or(""), "gateway ran");
    EXPECT_EQ(gateway->calls.load(), 1);
    EXPECT_EQ(sandbox->calls.load(), 0);
    EXPECT_EQ(coordinator->route_for(Language::RUST), Route::GATEWAY);
}

TEST_F(ExecutionCoordinatorTest, GatewayRouteWithoutGatewayIsRejected) {
    LanguageTable table = LanguageTable::defaults();
    LanguageSpec go = table.at(Language::GO);
    go.route = Route::GATEWAY;
    table.set(go);
    ExecutionCoordinator coordinator(sessions, history, sandbox, nullptr, table);

    auto result = coordinator.submit("live", "package main", "go");

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_TRUE(history->records.empty());
}

TEST_F(ExecutionCoordinatorTest, UnknownSession) {
    auto coordinator = make();

    auto result = coordinator->submit("missing", "print(1)", "python");

    EXPECT_EQ(result.status, ExecutionStatus::SESSION_NOT_FOUND);
    EXPECT_EQ(sandbox->calls.load(), 0);
}

TEST_F(ExecutionCoordinatorTest, ExpiredSession) {
    auto coordinator = make();

    auto result = coordinator->submit("expired", "print(1)", "python");

    EXPECT_EQ(result.status, ExecutionStatus::SESSION_EXPIRED);
    EXPECT_EQ(sandbox->calls.load(), 0);
}

TEST_F(ExecutionCoordinatorTest, SessionCheckedBeforeCode) {
    auto coordinator = make();

    // Both the session and the code are bad; the session wins
    EXPECT_EQ(coordinator->submit("missing", "", "cobol").status,
              ExecutionStatus::SESSION_NOT_FOUND);
    EXPECT_EQ(coordinator->submit("expired", "", "cobol").status,
              ExecutionStatus::SESSION_EXPIRED);
}

TEST_F(ExecutionCoordinatorTest, EmptyAndBlankCodeRejected) {
    auto coordinator = make();

    auto empty = coordinator->submit("live", "", "python");
    auto blank = coordinator->submit("live", "  \n\t ", "python");

    EXPECT_EQ(empty.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(empty.error.value_or(""), "Code cannot be empty");
    EXPECT_EQ(blank.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(sandbox->calls.load(), 0);
}

TEST_F(ExecutionCoordinatorTest, CodeAtLimitAccepted) {
    auto coordinator = make();

    auto result = coordinator->submit("live", std::string(MAX_CODE_SIZE, 'x'), "python");

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
}

TEST_F(ExecutionCoordinatorTest, CodeOverLimitRejected) {
    auto coordinator = make();

    auto result = coordinator->submit("live", std::string(MAX_CODE_SIZE + 1, 'x'), "python");

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(result.error.value_or(""), "Code is too long (max 50000 characters)");
    EXPECT_EQ(sandbox->calls.load(), 0);
}

TEST_F(ExecutionCoordinatorTest, LimitCountsCharactersNotBytes) {
    // Given: Multibyte source under the limit in characters but over it in bytes
    auto coordinator = make();
    std::string code = "# ";
    for (int i = 0; i < 30000; ++i) code += "\xC3\xA9";   // U+00E9

    // When: Submitted
    auto result = coordinator->submit("live", code, "python");

    // Then: Accepted and run
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(sandbox->calls.load(), 1);
}

TEST_F(ExecutionCoordinatorTest, MultibyteCodeOverLimitRejected) {
    auto coordinator = make();
    std::string code;
    for (size_t i = 0; i < MAX_CODE_SIZE + 1; ++i) code += "\xE2\x82\xAC";   // U+20AC

    auto result = coordinator->submit("live", code, "python");

    EXPECT_EQ(result.error.value_or(""), "Code is too long (max 50000 characters)");
}

TEST(CodeLengthTest, CountsUtf16Units) {
    EXPECT_EQ(code_length(""), 0u);
    EXPECT_EQ(code_length("print(1)"), 8u);
    EXPECT_EQ(code_length("\xC3\xA9t\xC3\xA9"), 3u);          // été
    EXPECT_EQ(code_length("\xE2\x82\xAC"), 1u);                // euro sign
    EXPECT_EQ(code_length("\xF0\x9F\x98\x80"), 2u);           // emoji: surrogate pair
}

TEST_F(ExecutionCoordinatorTest, SizeCheckedBeforeLanguage) {
    auto coordinator = make();

    auto result = coordinator->submit("live", std::string(MAX_CODE_SIZE + 1, 'x'), "cobol");

    EXPECT_EQ(result.error.value_or(""), "Code is too long (max 50000 characters)");
}

TEST_F(ExecutionCoordinatorTest, UnsupportedLanguage) {
    auto coordinator = make();

    auto result = coordinator->submit("live", "DISPLAY 'HI'", "cobol");

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED_INPUT);
    EXPECT_EQ(result.error.value_or(""), "Unsupported language: cobol");
}

TEST_F(ExecutionCoordinatorTest, RecordsEveryRoutedExecution) {
    auto coordinator = make();

    coordinator->submit("live", "print(1)", "python");

    ASSERT_EQ(history->records.size(), 1u);
    const auto& record = history->records[0];
    EXPECT_EQ(record.session_id, "live");
    EXPECT_EQ(record.code, "print(1)");
    EXPECT_EQ(record.language, Language::PYTHON);
    EXPECT_EQ(record.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(record.output.value_or(""), "sandbox ran");
    EXPECT_EQ(record.elapsed, std::chrono::milliseconds(7));
    EXPECT_FALSE(record.id.empty());
}

TEST_F(ExecutionCoordinatorTest, RejectedRequestsAreNotRecorded) {
    auto coordinator = make();

    coordinator->submit("live", "", "python");
    coordinator->submit("missing", "print(1)", "python");

    EXPECT_TRUE(history->records.empty());
}

TEST_F(ExecutionCoordinatorTest, HistoryFailureDoesNotHideResult) {
    history->fail = true;
    auto coordinator = make();

    auto result = coordinator->submit("live", "print(1)", "python");

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.output.value_or(""), "sandbox ran");
}

TEST_F(ExecutionCoordinatorTest, CapacityExceededWhenNoSlotFrees) {
    // Given: one slot, held by a blocked execution
    ExecutionCoordinator::Config config;
    config.slots.max_concurrent = 1;
    config.slots.queue_timeout = std::chrono::milliseconds(50);
    sandbox->block = true;
    auto coordinator = make(LanguageTable::defaults(), config);

    auto first = std::async(std::launch::async, [&]() {
        return coordinator->submit("live", "print(1)", "python");
    });
    while (coordinator->slots().active() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // When: a second request arrives
    auto second = coordinator->submit("live", "print(2)", "python");

    // Then: it waits out the queue and is turned away
    EXPECT_EQ(second.status, ExecutionStatus::CAPACITY_EXCEEDED);

    sandbox->release.set_value();
    EXPECT_EQ(first.get().status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(coordinator->slots().active(), 0);
    EXPECT_EQ(history->records.size(), 1u);
}

} // namespace
} // namespace codepair
