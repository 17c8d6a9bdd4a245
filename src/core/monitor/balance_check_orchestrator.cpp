#include "balance_check_orchestrator.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include <algorithm>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace BalanceMonitor {
namespace Core {

using BalanceMonitor::Utils::format_balance;

namespace {

constexpr const char* FAILED_BALANCE_TEXT = "error";
constexpr const char* FAST_FAILED_BALANCE_TEXT = "api failed";

// Selected accounts handed out one at a time to the check workers.
class AccountQueue {
public:
    explicit AccountQueue(const std::vector<Account>& queued_accounts) : accounts(queued_accounts) {}

    std::optional<Account> next() {
        std::lock_guard<std::mutex> lock(mtx);
        if (position >= accounts.size()) {
            return std::nullopt;
        }
        return accounts[position++];
    }

private:
    std::mutex mtx;
    const std::vector<Account>& accounts;
    size_t position = 0;
};

// Results in arrival order.
class ResultCollector {
public:
    void push(CheckResult result) {
        std::lock_guard<std::mutex> lock(mtx);
        results.push_back(std::move(result));
    }

    std::vector<CheckResult> take() {
        std::lock_guard<std::mutex> lock(mtx);
        return std::move(results);
    }

private:
    std::mutex mtx;
    std::vector<CheckResult> results;
};

CheckResult failure(const std::string& username, const std::string& source, const std::string& message) {
    return CheckResult::make(username, false, FAILED_BALANCE_TEXT, source, message);
}

CheckResult task_failure(const std::string& username, const std::string& detail) {
    return failure(username, "task", "check task failed: " + detail);
}

} // anonymous namespace

BalanceCheckOrchestrator::BalanceCheckOrchestrator(const BalanceMonitor::Config::SystemConfig& system_config,
                                                   const OrchestratorDependencies& dependencies)
    : config(system_config),
      state_store(dependencies.state_store),
      web_check_service(dependencies.web_check_service),
      probe_factory(dependencies.probe_factory),
      progress_sink(dependencies.progress_sink),
      metrics_sink(dependencies.metrics_sink) {}

std::vector<CheckResult> BalanceCheckOrchestrator::run_batch(const std::vector<Account>& accounts,
                                                             QueryMode mode,
                                                             const std::optional<std::string>& target) {
    Metrics::OperationTimer batch_timer = metrics_sink.start_operation(
        "batch_check", {{"mode", query_mode_name(mode)}, {"target", target ? *target : "all"}});

    API::FastBalanceProbePtr fast_probe;
    if (mode == QueryMode::NORMAL) {
        try {
            if (!probe_factory) {
                throw std::runtime_error("no fast probe factory configured");
            }
            fast_probe = probe_factory();
            if (!fast_probe) {
                throw std::runtime_error("fast probe factory returned nothing");
            }
        } catch (const std::exception& e) {
            std::string message = std::string("failed to initialize the balance API client: ") + e.what();
            emit(ProgressLevel::ERROR, "", message);
            batch_timer.finish(false, message);
            return {failure(SYSTEM_RESULT_USERNAME, "init", message)};
        }
    }

    std::vector<Account> selected;
    for (const auto& account : accounts) {
        if (!target || account.username == *target) {
            selected.push_back(account);
        }
    }

    emit(ProgressLevel::INFO, "", "checking " + std::to_string(selected.size()) + " account(s) in " +
                                      query_mode_name(mode) + " mode");

    // At most max_workers checks run at once; the rest wait in the queue
    size_t max_workers = static_cast<size_t>(std::max(1, config.performance.max_workers));
    size_t worker_count = std::min(max_workers, selected.size());
    AccountQueue queue(selected);
    ResultCollector collector;
    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    auto drain_queue = [this, mode, &fast_probe, &queue, &collector]() {
        while (std::optional<Account> account = queue.next()) {
            collector.push(run_account_task(*account, mode, fast_probe.get()));
        }
    };

    for (size_t index = 0; index < worker_count; ++index) {
        try {
            workers.emplace_back([drain_queue]() {
                Logging::set_log_thread_tag("CHECK ");
                drain_queue();
            });
        } catch (const std::system_error& e) {
            LOG_ERROR(std::string("Failed to start check worker: ") + e.what());
            break;
        }
    }

    if (workers.empty()) {
        drain_queue();
    }
    for (auto& worker : workers) {
        worker.join();
    }
    std::vector<CheckResult> results = collector.take();

    std::sort(results.begin(), results.end(), [](const CheckResult& lhs, const CheckResult& rhs) {
        return lhs.username < rhs.username;
    });

    size_t failure_count = static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const CheckResult& result) { return !result.success; }));
    emit(failure_count == 0 ? ProgressLevel::INFO : ProgressLevel::WARN, "",
         "batch finished: " + std::to_string(results.size() - failure_count) + " succeeded, " +
             std::to_string(failure_count) + " failed");
    batch_timer.finish(failure_count == 0,
                       failure_count == 0 ? "" : std::to_string(failure_count) + " account(s) failed");
    return results;
}

CheckResult BalanceCheckOrchestrator::run_account_task(const Account& account, QueryMode mode,
                                                       API::FastBalanceProbe* fast_probe) {
    Metrics::OperationTimer account_timer = metrics_sink.start_operation(
        "check_account", {{"username", account.username}, {"mode", query_mode_name(mode)}});
    CheckResult result;
    try {
        if (mode == QueryMode::WEB_ONLY) {
            result = check_web_only(account);
        } else {
            if (!fast_probe) {
                throw std::runtime_error("fast probe unavailable");
            }
            result = check_normal(account, *fast_probe);
        }
    } catch (const std::exception& e) {
        result = task_failure(account.username, e.what());
    } catch (...) {
        result = task_failure(account.username, "unknown error");
    }

    account_timer.finish(result.success, result.success ? "" : result.message);
    if (result.success) {
        emit(ProgressLevel::INFO, account.username, result.balance_text + " (" + result.source + ")");
    } else {
        emit(ProgressLevel::WARN, account.username, result.source + ": " + result.message);
    }
    return result;
}

CheckResult BalanceCheckOrchestrator::check_normal(const Account& account, API::FastBalanceProbe& fast_probe) {
    const bool forced = state_store.should_force_full(account.username);
    const bool has_key = account.has_api_key();

    if (forced) {
        emit(ProgressLevel::INFO, account.username, "first check of the cycle, running web login");
    } else if (has_key) {
        API::ProbeResult probe_result = fast_probe.probe(account.api_key);
        if (probe_result.success && probe_result.balance) {
            return accept_fast_result(account, probe_result);
        }
        if (!config.api.fallback_to_web) {
            std::optional<std::string> cached = state_store.get_cached_balance(account.username);
            if (cached) {
                return CheckResult::make(account.username, true, *cached, "cache",
                                         "API failed, using cache: " + probe_result.message);
            }
            return CheckResult::make(account.username, false, FAST_FAILED_BALANCE_TEXT, "api",
                                     probe_result.message);
        }
        emit(ProgressLevel::WARN, account.username, "API failed, falling back to web login: " + probe_result.message);
    }

    WebCheck::WebCheckResult web_result;
    try {
        web_result = web_check_service.run_web_check(account);
    } catch (const WebCheck::WebCheckError& e) {
        std::string message = std::string("web login unavailable: ") + e.what();
        if (!forced) {
            if (auto fast_result = retry_fast_probe(account, fast_probe)) {
                return *fast_result;
            }
        }
        return failure(account.username, "web_hook", message);
    }

    if (web_result.success && web_result.balance) {
        std::string balance_text = format_balance(*web_result.balance);
        persist_full_acquisition(account, balance_text, web_result);
        if (auto fast_result = retry_fast_probe(account, fast_probe)) {
            return *fast_result;
        }
        return CheckResult::make(account.username, true, balance_text, "web_hook",
                                 web_result.message.empty() ? "web login succeeded" : web_result.message);
    }

    if (web_result.success) {
        if (forced) {
            return failure(account.username, "web_hook", "first check of the cycle requires a balance");
        }
        if (auto fast_result = retry_fast_probe(account, fast_probe)) {
            return *fast_result;
        }
        return failure(account.username, "web_hook",
                       web_result.message.empty() ? "web login returned no balance" : web_result.message);
    }

    if (!forced) {
        if (auto fast_result = retry_fast_probe(account, fast_probe)) {
            return *fast_result;
        }
    }
    return failure(account.username, "web_hook",
                   web_result.message.empty() ? "web login failed" : web_result.message);
}

CheckResult BalanceCheckOrchestrator::check_web_only(const Account& account) {
    WebCheck::WebCheckResult web_result;
    try {
        web_result = web_check_service.run_web_check(account);
    } catch (const WebCheck::WebCheckError& e) {
        return failure(account.username, "web_only", std::string("web login unavailable: ") + e.what());
    }

    if (!web_result.success) {
        return failure(account.username, "web_only",
                       web_result.message.empty() ? "web login failed" : web_result.message);
    }
    if (!web_result.balance) {
        return failure(account.username, "web_only", "web login returned no balance");
    }

    std::string balance_text = format_balance(*web_result.balance);
    persist_full_acquisition(account, balance_text, web_result);
    return CheckResult::make(account.username, true, balance_text, "web_only",
                             web_result.message.empty() ? "web login succeeded" : web_result.message);
}

CheckResult BalanceCheckOrchestrator::accept_fast_result(const Account& account, const API::ProbeResult& probe_result) {
    std::string balance_text = format_balance(*probe_result.balance);
    persist_balance(account, balance_text);
    return CheckResult::make(account.username, true, balance_text, probe_result.source, probe_result.message);
}

std::optional<CheckResult> BalanceCheckOrchestrator::retry_fast_probe(const Account& account,
                                                                       API::FastBalanceProbe& fast_probe) {
    if (!account.has_api_key()) {
        return std::nullopt;
    }
    API::ProbeResult probe_result = fast_probe.probe(account.api_key);
    if (probe_result.success && probe_result.balance) {
        return accept_fast_result(account, probe_result);
    }
    LOG_DEBUG("Fast re-check for " + account.username + " failed: " + probe_result.message);
    return std::nullopt;
}

void BalanceCheckOrchestrator::persist_full_acquisition(const Account& account, const std::string& balance_text,
                                                        const WebCheck::WebCheckResult& web_result) {
    try {
        state_store.mark_cycle_fulfilled(account.username);
    } catch (const StateStoreError& e) {
        LOG_ERROR("Failed to persist cycle marker for " + account.username + ": " + e.what());
    }
    try {
        state_store.update_balance(account.username, balance_text, web_result.sync_success, web_result.sync_message);
    } catch (const StateStoreError& e) {
        LOG_ERROR("Failed to persist balance for " + account.username + ": " + e.what());
    }
}

void BalanceCheckOrchestrator::persist_balance(const Account& account, const std::string& balance_text) {
    try {
        state_store.update_balance(account.username, balance_text);
    } catch (const StateStoreError& e) {
        LOG_ERROR("Failed to persist balance for " + account.username + ": " + e.what());
    }
}

void BalanceCheckOrchestrator::emit(ProgressLevel level, const std::string& username, const std::string& message) {
    try {
        progress_sink.emit(level, username, message);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Progress sink failed: ") + e.what());
    }
}

} // namespace Core
} // namespace BalanceMonitor
