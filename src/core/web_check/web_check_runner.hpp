#ifndef WEB_CHECK_RUNNER_HPP
#define WEB_CHECK_RUNNER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include "web_check_result.hpp"
#include "slow_balance_strategy.hpp"
#include "hook_command_strategy.hpp"
#include "configs/system_config.hpp"
#include "core/accounts/account.hpp"
#include "core/browser/worker_pool_interface.hpp"

namespace BalanceMonitor {
namespace WebCheck {

// Slow acquisition as seen by the orchestrator.
class WebCheckService {
public:
    virtual ~WebCheckService() = default;

    // Flow failures come back as unsuccessful results; WebCheckError means the check could not run.
    virtual WebCheckResult run_web_check(const Core::Account& account) = 0;
};

/**
 * Runs the slow check for one account: the hook command when configured,
 * otherwise the worker strategy on a leased pool worker with bounded retries
 * under one overall deadline. The lease is released on every path.
 */
class WebCheckRunner : public WebCheckService {
public:
    WebCheckRunner(const BalanceMonitor::Config::SystemConfig& system_config,
                   Browser::WorkerPoolInterface& worker_pool,
                   std::shared_ptr<SlowBalanceStrategy> slow_strategy,
                   std::function<void()> pool_warm_up = std::function<void()>());

    WebCheckResult run_web_check(const Core::Account& account) override;

private:
    const BalanceMonitor::Config::SystemConfig& config;
    Browser::WorkerPoolInterface& pool;
    std::shared_ptr<SlowBalanceStrategy> strategy;
    std::function<void()> warm_up;
    std::once_flag warm_up_once;
    std::unique_ptr<HookCommandStrategy> hook_strategy;

    WebCheckResult run_on_worker(const Core::Account& account);
    WebCheckResult run_attempts(const Core::Account& account, const std::string& endpoint);
};

} // namespace WebCheck
} // namespace BalanceMonitor

#endif // WEB_CHECK_RUNNER_HPP
