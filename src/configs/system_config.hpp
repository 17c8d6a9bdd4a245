#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "browser_config.hpp"
#include "web_check_config.hpp"
#include "performance_config.hpp"
#include "logging_config.hpp"
#include "metrics_config.hpp"

namespace BalanceMonitor {
namespace Config {

/**
 * Main monitor configuration.
 * Loaded from runtime_config.csv in the configuration directory; every field
 * carries a default so a missing file still yields a usable configuration.
 */
struct SystemConfig {
    SystemConfig() {}

    PerformanceConfig performance;     // Concurrency, retries, polling interval, cycle rollover
    ApiConfig api;                     // Fast balance probe endpoint
    BrowserConfig browser;             // Browser session options for the login flow
    WebCheckConfig web_check;          // Worker pool and slow check settings
    LoggingConfig logging;             // Log file and level
    MetricsConfig metrics;             // Operation history
};

} // namespace Config
} // namespace BalanceMonitor

#endif // SYSTEM_CONFIG_HPP
