#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <string>
#include <atomic>
#include <fstream>
#include <memory>
#include <vector>
#include "core/logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace BalanceMonitor {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<BalanceMonitor::Logging::AsyncLogger> logger,
                  const BalanceMonitor::Config::LoggingConfig& logging_config)
        : logger_ptr(logger), config(logging_config) {}

    void operator()();

    unsigned long get_flush_count() const { return flush_count.load(); }

private:
    std::shared_ptr<BalanceMonitor::Logging::AsyncLogger> logger_ptr;
    const BalanceMonitor::Config::LoggingConfig config;
    std::atomic<unsigned long> flush_count{0};

    void execute_logging_processing_loop();
    void wait_and_collect_messages(std::vector<std::string>& message_buffer);
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);
    void output_log_line(const std::string& log_line, std::ofstream& log_file);
};

} // namespace Threads
} // namespace BalanceMonitor

#endif // LOGGING_THREAD_HPP
