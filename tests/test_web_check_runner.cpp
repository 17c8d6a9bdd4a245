#include <gtest/gtest.h>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/web_check/web_check_runner.hpp"

using namespace BalanceMonitor;
using namespace BalanceMonitor::WebCheck;

namespace {

constexpr const char* WORKER_ENDPOINT = "http://127.0.0.1:9515";

// Pool double that always has a worker and counts the round trips.
class ReadyPool : public Browser::WorkerPoolInterface {
public:
    std::atomic<int> acquire_calls{0};
    std::atomic<int> release_calls{0};

    std::optional<Browser::PoolTicket> try_acquire() override {
        ++acquire_calls;
        Browser::PoolTicket ticket;
        ticket.endpoint = WORKER_ENDPOINT;
        ticket.slot_id = 1;
        return ticket;
    }

    void release(const Browser::PoolTicket&) override { ++release_calls; }

    Browser::PoolStats get_stats() override { return Browser::PoolStats(); }
};

// Plays one scripted step per attempt; the last step repeats once the script runs out.
class ScriptedAttempts : public SlowBalanceStrategy {
public:
    using Step = std::function<WebCheckResult()>;

    std::deque<Step> steps;
    std::vector<std::string> endpoints;

    WebCheckResult run_once(const Core::Account&, const std::string& worker_endpoint,
                            const Config::BrowserConfig&, const Utils::AttemptDeadline&) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mtx);
            endpoints.push_back(worker_endpoint);
            step = steps.front();
            if (steps.size() > 1) {
                steps.pop_front();
            }
        }
        return step();
    }

    size_t attempt_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return endpoints.size();
    }

private:
    std::mutex mtx;
};

ScriptedAttempts::Step failing_step(const std::string& message) {
    return [message]() -> WebCheckResult { throw std::runtime_error(message); };
}

ScriptedAttempts::Step balance_step(double balance) {
    return [balance]() {
        WebCheckResult result;
        result.success = true;
        result.balance = balance;
        result.message = "logged in";
        return result;
    };
}

Core::Account make_account() {
    Core::Account account;
    account.username = "alice";
    account.password = "secret";
    return account;
}

class WebCheckRunnerTest : public ::testing::Test {
protected:
    Config::SystemConfig config;
    ReadyPool pool;
    std::shared_ptr<ScriptedAttempts> strategy = std::make_shared<ScriptedAttempts>();

    void SetUp() override {
        config.web_check.enabled = false;
        config.web_check.timeout_seconds = 5;
        config.web_check.acquire_timeout_seconds = 1;
        config.performance.retry_times = 3;
        config.performance.retry_delay_sec = 1;
    }

    WebCheckResult run() {
        WebCheckRunner runner(config, pool, strategy);
        return runner.run_web_check(make_account());
    }
};

} // namespace

TEST_F(WebCheckRunnerTest, FailedAttemptsAreRetriedUntilOneSucceeds) {
    strategy->steps = {failing_step("login form missing"), failing_step("session lost"), balance_step(7.5)};

    WebCheckResult result = run();

    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.balance.has_value());
    EXPECT_DOUBLE_EQ(*result.balance, 7.5);
    EXPECT_EQ(strategy->attempt_count(), 3u);
    for (const auto& endpoint : strategy->endpoints) {
        EXPECT_EQ(endpoint, WORKER_ENDPOINT);
    }
    EXPECT_EQ(pool.acquire_calls.load(), 1);
    EXPECT_EQ(pool.release_calls.load(), 1);
}

TEST_F(WebCheckRunnerTest, StopsAtFirstSuccessfulAttempt) {
    strategy->steps = {failing_step("login form missing"), balance_step(2.0), failing_step("not expected")};

    WebCheckResult result = run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(strategy->attempt_count(), 2u);
}

TEST_F(WebCheckRunnerTest, GivesUpAfterRetryTimesAttempts) {
    config.performance.retry_times = 2;
    strategy->steps = {failing_step("login form missing")};

    WebCheckResult result = run();

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.balance.has_value());
    EXPECT_EQ(strategy->attempt_count(), 2u);
    EXPECT_NE(result.message.find("after 2 attempts"), std::string::npos);
    EXPECT_NE(result.message.find("login form missing"), std::string::npos);
    EXPECT_EQ(pool.release_calls.load(), 1);
}

TEST_F(WebCheckRunnerTest, ExpiredDeadlineEndsTheFlow) {
    strategy->steps = {[]() -> WebCheckResult {
        throw Utils::AttemptTimeoutError("deadline of 20s exceeded during navigate");
    }};

    WebCheckResult result = run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "web flow timed out (20s)");
    EXPECT_EQ(strategy->attempt_count(), 1u);
    EXPECT_EQ(pool.release_calls.load(), 1);
}

TEST_F(WebCheckRunnerTest, UnsuccessfulResultIsReturnedWithoutRetry) {
    strategy->steps = {[]() {
        WebCheckResult result;
        result.message = "invalid password";
        return result;
    }};

    WebCheckResult result = run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "invalid password");
    EXPECT_EQ(strategy->attempt_count(), 1u);
}
