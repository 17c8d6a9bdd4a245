#ifndef METRICS_CONFIG_HPP
#define METRICS_CONFIG_HPP

namespace BalanceMonitor {
namespace Config {

struct MetricsConfig {
    int history_size = 1000;
    int slow_operation_threshold_ms = 10000;
};

} // namespace Config
} // namespace BalanceMonitor

#endif // METRICS_CONFIG_HPP
