#include <gtest/gtest.h>
#include "core/web_check/hook_command_strategy.hpp"

using namespace BalanceMonitor::WebCheck;
using BalanceMonitor::Core::Account;

namespace {

Account sample_account() {
    Account account;
    account.username = "alice";
    account.password = "p@ss word";
    account.api_key = "sk-alice";
    return account;
}

} // namespace

TEST(HookCommandStrategyTest, SubstitutesPlaceholders) {
    HookCommandStrategy hook("login-hook", {"--user={username}", "{password}", "--key", "{api_key}"}, 30);
    std::vector<std::string> argv = hook.build_argv(sample_account());
    ASSERT_EQ(argv.size(), 5u);
    EXPECT_EQ(argv[0], "login-hook");
    EXPECT_EQ(argv[1], "--user=alice");
    EXPECT_EQ(argv[2], "p@ss word");
    EXPECT_EQ(argv[4], "sk-alice");
}

TEST(HookCommandStrategyTest, ParsesJsonOutput) {
    HookCommandStrategy hook("/bin/sh",
                             {"-c", "echo '{\"success\": true, \"balance\": \"$25.40\", \"message\": \"checked in\", "
                                    "\"apikey_sync_success\": false, \"apikey_sync_message\": \"rate limited\"}'"},
                             10);
    WebCheckResult result = hook.run(sample_account());
    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.balance.value(), 25.4);
    EXPECT_EQ(result.message, "checked in");
    EXPECT_EQ(result.sync_success.value(), false);
    EXPECT_EQ(result.sync_message.value(), "rate limited");
}

TEST(HookCommandStrategyTest, ParsesPlainNumberOutput) {
    HookCommandStrategy hook("/bin/sh", {"-c", "echo 'balance for {username}: 1,024.5'"}, 10);
    WebCheckResult result = hook.run(sample_account());
    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.balance.value(), 1024.5);
}

TEST(HookCommandStrategyTest, EmptyOutputIsSuccessWithoutBalance) {
    HookCommandStrategy hook("/bin/sh", {"-c", "true"}, 10);
    WebCheckResult result = hook.run(sample_account());
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.balance.has_value());
}

TEST(HookCommandStrategyTest, NonZeroExitIsCommandError) {
    HookCommandStrategy hook("/bin/sh", {"-c", "echo 'login page changed' >&2; exit 3"}, 10);
    try {
        hook.run(sample_account());
        FAIL() << "expected WebCheckError";
    } catch (const WebCheckError& error) {
        std::string message = error.what();
        EXPECT_NE(message.find("code 3"), std::string::npos);
        EXPECT_NE(message.find("login page changed"), std::string::npos);
    }
}

TEST(HookCommandStrategyTest, MissingExecutableIsCommandError) {
    HookCommandStrategy hook("/nonexistent/login-hook", {}, 10);
    EXPECT_THROW(hook.run(sample_account()), WebCheckError);
}

TEST(HookCommandStrategyTest, SlowCommandTimesOut) {
    try {
        run_command_with_timeout({"/bin/sh", "-c", "sleep 5"}, std::chrono::milliseconds(300));
        FAIL() << "expected WebCheckError";
    } catch (const WebCheckError& error) {
        EXPECT_NE(std::string(error.what()).find("timed out"), std::string::npos);
    }
}

TEST(HookOutputTest, JsonFailureKeepsMessage) {
    WebCheckResult result = parse_hook_output(R"({"success": false, "message": "captcha required"})");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "captcha required");
    EXPECT_FALSE(result.sync_success.has_value());
}
