#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include "configs/config_loader.hpp"
#include "configs/system_config.hpp"
#include "core/logging/logger/async_logger.hpp"
#include "core/system/system_modules.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Central system state container
 *
 * Configuration, runtime paths, modules and the synchronization primitives
 * shared by the command loop and the signal handler.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards waits on cv
    std::condition_variable cv;        // Wakes the watch loop on shutdown
    std::mutex batch_mutex;            // One batch at a time

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};
    std::atomic<bool> shutdown_requested{false};
    std::atomic<unsigned long> batch_count{0};

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    BalanceMonitor::Config::SystemConfig config;
    BalanceMonitor::Config::RuntimePaths paths;
    BalanceMonitor::Logging::LoggingContext logging_context;
    std::shared_ptr<BalanceMonitor::Logging::AsyncLogger> logger;
    std::unique_ptr<SystemModules> modules;

    SystemState() = default;

    SystemState(const BalanceMonitor::Config::SystemConfig& initial,
                const BalanceMonitor::Config::RuntimePaths& runtime_paths)
        : config(initial), paths(runtime_paths) {}
};

#endif // SYSTEM_STATE_HPP
