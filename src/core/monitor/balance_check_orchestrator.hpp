#ifndef BALANCE_CHECK_ORCHESTRATOR_HPP
#define BALANCE_CHECK_ORCHESTRATOR_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "check_result.hpp"
#include "progress_sink.hpp"
#include "api/balance/balance_probe_interface.hpp"
#include "configs/system_config.hpp"
#include "core/accounts/account.hpp"
#include "core/metrics/performance_monitor.hpp"
#include "core/state/state_store.hpp"
#include "core/web_check/web_check_runner.hpp"

namespace BalanceMonitor {
namespace Core {

using FastProbeFactory = std::function<API::FastBalanceProbePtr()>;

struct OrchestratorDependencies {
    StateStore& state_store;
    WebCheck::WebCheckService& web_check_service;
    FastProbeFactory probe_factory;
    ProgressSink& progress_sink;
    Metrics::MetricsSink& metrics_sink;
};

/**
 * Runs one batch of balance checks with bounded concurrency.
 *
 * At most performance.max_workers worker threads pull accounts from a shared
 * queue. Every selected account yields exactly one CheckResult; the returned vector
 * is sorted by username. A fast probe client that cannot be built yields a
 * single SYSTEM result tagged "init".
 */
class BalanceCheckOrchestrator {
public:
    BalanceCheckOrchestrator(const BalanceMonitor::Config::SystemConfig& system_config,
                             const OrchestratorDependencies& dependencies);

    std::vector<CheckResult> run_batch(const std::vector<Account>& accounts,
                                       QueryMode mode,
                                       const std::optional<std::string>& target = std::nullopt);

private:
    const BalanceMonitor::Config::SystemConfig& config;
    StateStore& state_store;
    WebCheck::WebCheckService& web_check_service;
    FastProbeFactory probe_factory;
    ProgressSink& progress_sink;
    Metrics::MetricsSink& metrics_sink;

    CheckResult run_account_task(const Account& account, QueryMode mode, API::FastBalanceProbe* fast_probe);

    CheckResult check_normal(const Account& account, API::FastBalanceProbe& fast_probe);
    CheckResult check_web_only(const Account& account);

    CheckResult accept_fast_result(const Account& account, const API::ProbeResult& probe_result);
    std::optional<CheckResult> retry_fast_probe(const Account& account, API::FastBalanceProbe& fast_probe);
    void persist_full_acquisition(const Account& account, const std::string& balance_text,
                                  const WebCheck::WebCheckResult& web_result);
    void persist_balance(const Account& account, const std::string& balance_text);

    void emit(ProgressLevel level, const std::string& username, const std::string& message);
};

} // namespace Core
} // namespace BalanceMonitor

#endif // BALANCE_CHECK_ORCHESTRATOR_HPP
