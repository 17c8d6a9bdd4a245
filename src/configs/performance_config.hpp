#ifndef PERFORMANCE_CONFIG_HPP
#define PERFORMANCE_CONFIG_HPP

namespace BalanceMonitor {
namespace Config {

struct PerformanceConfig {
    int max_workers = 9;
    int query_interval_sec = 60;
    int retry_times = 2;
    int retry_delay_sec = 3;
    int daily_rollover_hour = 8;
};

} // namespace Config
} // namespace BalanceMonitor

#endif // PERFORMANCE_CONFIG_HPP
