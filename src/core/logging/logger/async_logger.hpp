#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include "configs/system_config.hpp"

namespace BalanceMonitor {
namespace Logging {


// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class AsyncLogger {
private:
    std::string file_path;

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::atomic<bool> console_output{true};
    std::atomic<int> minimum_level{static_cast<int>(LogLevel::INFO)};
};

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function
void log_message(const std::string& message, const std::string& log_file_path);

// Level-filtered logging used by the LOG_DEBUG/INFO/WARN/ERROR macros
void log_leveled_message(LogLevel level, const std::string& message);
bool is_log_level_enabled(LogLevel level);
LogLevel parse_log_level(const std::string& level_name);
const char* log_level_label(LogLevel level);

// Global lifecycle helpers (use context internally)
void initialize_global_logger(AsyncLogger& logger);
void shutdown_global_logger(AsyncLogger& logger);

// Application foundation initialization
std::shared_ptr<AsyncLogger> initialize_application_foundation(const BalanceMonitor::Config::SystemConfig& config,
                                                               const std::string& log_file_path);

// Context-backed accessors (no externs)
std::mutex& get_console_mutex();
bool is_console_output_enabled();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace BalanceMonitor

#endif // ASYNC_LOGGER_HPP
