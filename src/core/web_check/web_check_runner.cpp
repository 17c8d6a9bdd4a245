#include "web_check_runner.hpp"
#include "core/browser/pool_lease.hpp"
#include "core/browser/worker_process.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/attempt_deadline.hpp"
#include "core/utils/balance_text.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

namespace BalanceMonitor {
namespace WebCheck {

namespace {
    constexpr int MIN_FLOW_TIMEOUT_SECONDS = 20;
}

WebCheckRunner::WebCheckRunner(const BalanceMonitor::Config::SystemConfig& system_config,
                               Browser::WorkerPoolInterface& worker_pool,
                               std::shared_ptr<SlowBalanceStrategy> slow_strategy,
                               std::function<void()> pool_warm_up)
    : config(system_config), pool(worker_pool), strategy(std::move(slow_strategy)), warm_up(std::move(pool_warm_up)) {
    if (config.web_check.enabled && !Utils::is_blank(config.web_check.command)) {
        hook_strategy = std::make_unique<HookCommandStrategy>(config.web_check.command, config.web_check.args,
                                                              config.web_check.timeout_seconds);
    }
}

WebCheckResult WebCheckRunner::run_web_check(const Core::Account& account) {
    if (hook_strategy) {
        return hook_strategy->run(account);
    }
    if (!strategy) {
        throw WebCheckError("no slow balance strategy configured");
    }
    return run_on_worker(account);
}

WebCheckResult WebCheckRunner::run_on_worker(const Core::Account& account) {
    if (warm_up) {
        std::call_once(warm_up_once, warm_up);
    }

    auto acquire_timeout = std::chrono::seconds(std::max(1, config.web_check.acquire_timeout_seconds));
    auto poll_interval = std::chrono::milliseconds(std::max(1, config.web_check.acquire_poll_interval_ms));

    try {
        Browser::PoolLease lease = Browser::acquire_worker_lease(pool, acquire_timeout, poll_interval);
        LOG_DEBUG("[" + account.username + "] leased worker " + lease.endpoint());

        WebCheckResult result = run_attempts(account, lease.endpoint());
        lease.release();

        Browser::PoolStats stats = pool.get_stats();
        char rate_text[32];
        std::snprintf(rate_text, sizeof(rate_text), "%.1f", stats.reuse_rate);
        LOG_DEBUG("Worker pool: reuse rate " + std::string(rate_text) + "%, idle " + std::to_string(stats.idle_workers) +
                  ", busy " + std::to_string(stats.busy_workers));
        return result;
    } catch (const Browser::WorkerAcquireTimeout& timeout_error) {
        throw WebCheckError(timeout_error.what());
    } catch (const Browser::WorkerSpawnError& spawn_error) {
        throw WebCheckError(std::string("could not start a browser worker: ") + spawn_error.what());
    }
}

WebCheckResult WebCheckRunner::run_attempts(const Core::Account& account, const std::string& endpoint) {
    int flow_timeout_seconds = std::max(MIN_FLOW_TIMEOUT_SECONDS, config.web_check.timeout_seconds);
    Utils::AttemptDeadline deadline{std::chrono::seconds(flow_timeout_seconds)};
    int attempts = std::max(1, config.performance.retry_times);
    auto retry_delay = std::chrono::seconds(std::max(1, config.performance.retry_delay_sec));

    WebCheckResult timed_out;
    timed_out.message = "web flow timed out (" + std::to_string(flow_timeout_seconds) + "s)";

    std::string last_error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            return strategy->run_once(account, endpoint, config.browser, deadline);
        } catch (const Utils::AttemptTimeoutError& timeout_error) {
            LOG_WARN("[" + account.username + "] " + timeout_error.what());
            return timed_out;
        } catch (const std::exception& attempt_error) {
            last_error = attempt_error.what();
            LOG_WARN("[" + account.username + "] login attempt " + std::to_string(attempt) + "/" +
                     std::to_string(attempts) + " failed: " + last_error);
        }

        if (attempt < attempts) {
            if (deadline.remaining() <= retry_delay) {
                return timed_out;
            }
            std::this_thread::sleep_for(retry_delay);
        }
    }

    WebCheckResult failed;
    failed.message = "web flow failed after " + std::to_string(attempts) + " attempts: " + last_error;
    return failed;
}

} // namespace WebCheck
} // namespace BalanceMonitor
