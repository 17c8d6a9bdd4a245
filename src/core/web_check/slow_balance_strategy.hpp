#ifndef SLOW_BALANCE_STRATEGY_HPP
#define SLOW_BALANCE_STRATEGY_HPP

#include <string>
#include "web_check_result.hpp"
#include "configs/browser_config.hpp"
#include "core/accounts/account.hpp"
#include "core/utils/attempt_deadline.hpp"

namespace BalanceMonitor {
namespace WebCheck {

/**
 * One attempt of the slow, worker-driven balance acquisition.
 * Throws on a failed attempt (the caller decides whether to retry) and
 * AttemptTimeoutError once the deadline is exceeded.
 */
class SlowBalanceStrategy {
public:
    virtual ~SlowBalanceStrategy() = default;
    virtual WebCheckResult run_once(const Core::Account& account,
                                    const std::string& worker_endpoint,
                                    const BalanceMonitor::Config::BrowserConfig& browser_config,
                                    const Utils::AttemptDeadline& deadline) = 0;
};

} // namespace WebCheck
} // namespace BalanceMonitor

#endif // SLOW_BALANCE_STRATEGY_HPP
