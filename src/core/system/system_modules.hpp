#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include "core/accounts/account_store.hpp"
#include "core/browser/worker_process_pool.hpp"
#include "core/metrics/performance_monitor.hpp"
#include "core/monitor/balance_check_orchestrator.hpp"
#include "core/monitor/progress_sink.hpp"
#include "core/state/state_store.hpp"
#include "core/threads/logging_thread.hpp"
#include "core/web_check/web_check_runner.hpp"
#include "core/web_check/web_login_strategy.hpp"
#include <memory>

// Members are destroyed bottom-up: the orchestrator goes before what it references.
struct SystemModules {
    std::unique_ptr<BalanceMonitor::Threads::LoggingThread> logging_thread;
    std::unique_ptr<BalanceMonitor::Core::AccountStore> account_store;
    std::unique_ptr<BalanceMonitor::Core::StateStore> state_store;
    std::unique_ptr<BalanceMonitor::Metrics::PerformanceMonitor> performance_monitor;
    std::unique_ptr<BalanceMonitor::Browser::WorkerProcessPool> worker_pool;
    std::shared_ptr<BalanceMonitor::WebCheck::WebLoginStrategy> login_strategy;
    std::unique_ptr<BalanceMonitor::WebCheck::WebCheckRunner> web_check_runner;
    std::unique_ptr<BalanceMonitor::Core::LoggingProgressSink> progress_sink;
    std::unique_ptr<BalanceMonitor::Core::BalanceCheckOrchestrator> orchestrator;
};

#endif // SYSTEM_MODULES_HPP
