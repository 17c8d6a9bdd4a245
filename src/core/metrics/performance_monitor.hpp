#ifndef PERFORMANCE_MONITOR_HPP
#define PERFORMANCE_MONITOR_HPP

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "configs/metrics_config.hpp"

namespace BalanceMonitor {
namespace Metrics {

using OperationTags = std::map<std::string, std::string>;

struct OperationRecord {
    std::string name;
    OperationTags tags;
    bool success = false;
    std::string error_message;
    long long duration_ms = 0;
    std::chrono::system_clock::time_point finished_at;
};

struct OperationStats {
    unsigned long count = 0;
    unsigned long success_count = 0;
    unsigned long failure_count = 0;
    long long total_ms = 0;
    long long min_ms = 0;
    long long max_ms = 0;

    double average_ms() const { return count > 0 ? static_cast<double>(total_ms) / static_cast<double>(count) : 0.0; }
    double success_rate() const { return count > 0 ? static_cast<double>(success_count) / static_cast<double>(count) * 100.0 : 0.0; }
};

class OperationTimer;

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record_operation(const OperationRecord& record) = 0;

    OperationTimer start_operation(const std::string& name, const OperationTags& tags = OperationTags());
};

/**
 * Times one operation. finish() records it once; a timer destroyed unfinished
 * records a failure so no started operation goes missing.
 */
class OperationTimer {
public:
    OperationTimer(MetricsSink& metrics_sink, const std::string& operation_name, const OperationTags& operation_tags);
    ~OperationTimer();

    OperationTimer(OperationTimer&& other) noexcept;
    OperationTimer(const OperationTimer&) = delete;
    OperationTimer& operator=(const OperationTimer&) = delete;
    OperationTimer& operator=(OperationTimer&&) = delete;

    void finish(bool success, const std::string& error_message = "");
    bool is_finished() const { return finished; }

private:
    MetricsSink* sink;
    std::string name;
    OperationTags tags;
    std::chrono::steady_clock::time_point started;
    bool finished;
};

// Operation history and per-operation statistics.
class PerformanceMonitor : public MetricsSink {
public:
    explicit PerformanceMonitor(const BalanceMonitor::Config::MetricsConfig& metrics_config);

    void record_operation(const OperationRecord& record) override;

    std::optional<OperationStats> get_stats(const std::string& name) const;
    std::map<std::string, OperationStats> get_all_stats() const;
    std::vector<OperationRecord> get_recent(size_t limit) const;
    std::string generate_report() const;
    void clear();

private:
    size_t history_limit;
    long long slow_threshold_ms;
    mutable std::mutex metrics_mutex;
    std::deque<OperationRecord> history;
    std::map<std::string, OperationStats> stats_by_name;
};

} // namespace Metrics
} // namespace BalanceMonitor

#endif // PERFORMANCE_MONITOR_HPP
