#include "performance_monitor.hpp"
#include "core/logging/logging_macros.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace BalanceMonitor {
namespace Metrics {

OperationTimer MetricsSink::start_operation(const std::string& name, const OperationTags& tags) {
    return OperationTimer(*this, name, tags);
}

// ========================================================================
// OPERATION TIMER
// ========================================================================

OperationTimer::OperationTimer(MetricsSink& metrics_sink, const std::string& operation_name, const OperationTags& operation_tags)
    : sink(&metrics_sink), name(operation_name), tags(operation_tags),
      started(std::chrono::steady_clock::now()), finished(false) {}

OperationTimer::OperationTimer(OperationTimer&& other) noexcept
    : sink(other.sink), name(std::move(other.name)), tags(std::move(other.tags)),
      started(other.started), finished(other.finished) {
    other.finished = true;
}

OperationTimer::~OperationTimer() {
    if (!finished) {
        finish(false, "operation abandoned");
    }
}

void OperationTimer::finish(bool success, const std::string& error_message) {
    if (finished) {
        return;
    }
    finished = true;

    OperationRecord record;
    record.name = name;
    record.tags = tags;
    record.success = success;
    record.error_message = error_message;
    record.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    record.finished_at = std::chrono::system_clock::now();
    sink->record_operation(record);
}

// ========================================================================
// PERFORMANCE MONITOR
// ========================================================================

PerformanceMonitor::PerformanceMonitor(const BalanceMonitor::Config::MetricsConfig& metrics_config)
    : history_limit(static_cast<size_t>(std::max(1, metrics_config.history_size))),
      slow_threshold_ms(metrics_config.slow_operation_threshold_ms) {}

void PerformanceMonitor::record_operation(const OperationRecord& record) {
    {
        std::lock_guard<std::mutex> lock(metrics_mutex);
        history.push_back(record);
        while (history.size() > history_limit) {
            history.pop_front();
        }

        OperationStats& stats = stats_by_name[record.name];
        if (stats.count == 0) {
            stats.min_ms = record.duration_ms;
            stats.max_ms = record.duration_ms;
        } else {
            stats.min_ms = std::min(stats.min_ms, record.duration_ms);
            stats.max_ms = std::max(stats.max_ms, record.duration_ms);
        }
        stats.count += 1;
        stats.total_ms += record.duration_ms;
        if (record.success) {
            stats.success_count += 1;
        } else {
            stats.failure_count += 1;
        }
    }

    auto username_it = record.tags.find("username");
    std::string subject = username_it != record.tags.end() ? " [" + username_it->second + "]" : "";
    if (!record.success) {
        LOG_WARN("Operation failed: " + record.name + subject + " after " + std::to_string(record.duration_ms) + "ms" +
                 (record.error_message.empty() ? "" : ": " + record.error_message));
    } else if (record.duration_ms > slow_threshold_ms) {
        LOG_WARN("Slow operation: " + record.name + subject + " took " + std::to_string(record.duration_ms) + "ms");
    }
}

std::optional<OperationStats> PerformanceMonitor::get_stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    auto it = stats_by_name.find(name);
    if (it == stats_by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, OperationStats> PerformanceMonitor::get_all_stats() const {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    return stats_by_name;
}

std::vector<OperationRecord> PerformanceMonitor::get_recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    size_t count = std::min(limit, history.size());
    return std::vector<OperationRecord>(history.end() - static_cast<std::ptrdiff_t>(count), history.end());
}

std::string PerformanceMonitor::generate_report() const {
    std::map<std::string, OperationStats> snapshot = get_all_stats();
    std::ostringstream report;
    report << "PERFORMANCE REPORT\n";
    if (snapshot.empty()) {
        report << "  no operations recorded\n";
        return report.str();
    }
    report << std::fixed << std::setprecision(1);
    for (const auto& entry : snapshot) {
        const OperationStats& stats = entry.second;
        report << "  " << entry.first
               << ": count=" << stats.count
               << " success=" << stats.success_count
               << " fail=" << stats.failure_count
               << " rate=" << stats.success_rate() << "%"
               << " avg=" << stats.average_ms() << "ms"
               << " min=" << stats.min_ms << "ms"
               << " max=" << stats.max_ms << "ms\n";
    }
    return report.str();
}

void PerformanceMonitor::clear() {
    std::lock_guard<std::mutex> lock(metrics_mutex);
    history.clear();
    stats_by_name.clear();
}

} // namespace Metrics
} // namespace BalanceMonitor
