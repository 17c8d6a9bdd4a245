#ifndef HOOK_COMMAND_STRATEGY_HPP
#define HOOK_COMMAND_STRATEGY_HPP

#include <chrono>
#include <string>
#include <vector>
#include "web_check_result.hpp"
#include "core/accounts/account.hpp"

namespace BalanceMonitor {
namespace WebCheck {

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
};

// Runs argv without a shell; throws WebCheckError when it cannot start or outlives the timeout.
CommandOutput run_command_with_timeout(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

// Maps hook stdout to a result: empty output, a JSON object, or text holding a number.
WebCheckResult parse_hook_output(const std::string& stdout_text);

/**
 * Slow check delegated to an external command.
 * Arguments may contain {username}, {password} and {api_key}.
 */
class HookCommandStrategy {
public:
    HookCommandStrategy(const std::string& hook_command, const std::vector<std::string>& hook_args, int timeout_seconds);

    // Non-zero exit and timeouts are WebCheckError (command-level failures).
    WebCheckResult run(const Core::Account& account) const;

    std::vector<std::string> build_argv(const Core::Account& account) const;

private:
    std::string command;
    std::vector<std::string> args;
    std::chrono::seconds timeout;
};

} // namespace WebCheck
} // namespace BalanceMonitor

#endif // HOOK_COMMAND_STRATEGY_HPP
