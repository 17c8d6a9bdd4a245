/**
 * Asynchronous logging for the balance monitor.
 * Producers format and enqueue lines; the LoggingThread drains them to file and console.
 */
#include "async_logger.hpp"
#include "core/utils/time_utils.hpp"
#include <iostream>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace BalanceMonitor {
namespace Logging {

static std::atomic<AsyncLogger*> g_async_logger{nullptr};
static thread_local std::string t_log_tag = "MAIN  ";
static std::atomic<LoggingContext*> g_logging_context{nullptr};

void set_async_logger(AsyncLogger* logger) {
    g_async_logger.store(logger);
}

void set_log_thread_tag(const std::string& tag6) {
    std::string t = tag6;
    if (t.size() < LOG_TAG_WIDTH) t.append(LOG_TAG_WIDTH - t.size(), ' ');
    if (t.size() > LOG_TAG_WIDTH) t = t.substr(0, LOG_TAG_WIDTH);
    t_log_tag = t;
}


void log_message(const std::string& message, const std::string& log_file_path) {
    std::string timestamp;
    try {
        timestamp = TimeUtils::get_current_human_readable_time();
    } catch (const std::exception&) {
        timestamp = "ERROR-TIME";
    }

    std::stringstream ss;
    ss << timestamp << " [" << t_log_tag << "]   " << message << std::endl;
    std::string log_str = ss.str();

    AsyncLogger* logger = g_async_logger.load();
    if (logger && logger->running.load()) {
        logger->enqueue(log_str);
        return;
    }

    {
        std::lock_guard<std::mutex> cguard(get_console_mutex());
        if (is_console_output_enabled()) {
            std::cout << log_str << std::flush;
        }
    }

    // Only write to file if log_file_path is not empty
    if (!log_file_path.empty()) {
        std::ofstream log_file(log_file_path, std::ios::app);
        if (log_file.is_open()) {
            log_file << log_str;
        }
    }
}

const char* log_level_label(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO ";
}

LogLevel parse_log_level(const std::string& level_name) {
    if (level_name == "DEBUG") return LogLevel::DEBUG;
    if (level_name == "INFO") return LogLevel::INFO;
    if (level_name == "WARN" || level_name == "WARNING") return LogLevel::WARN;
    if (level_name == "ERROR") return LogLevel::ERROR;
    throw std::runtime_error("Unknown log level: " + level_name);
}

bool is_log_level_enabled(LogLevel level) {
    auto* ctx = g_logging_context.load();
    int minimum = ctx ? ctx->minimum_level.load() : static_cast<int>(LogLevel::INFO);
    return static_cast<int>(level) >= minimum;
}

void log_leveled_message(LogLevel level, const std::string& message) {
    if (!is_log_level_enabled(level)) {
        return;
    }
    log_message(std::string(log_level_label(level)) + " " + message, "");
}

void initialize_global_logger(AsyncLogger& logger) {
    set_async_logger(&logger);
    // Thread will be started separately via LoggingThread
}

void shutdown_global_logger(AsyncLogger& logger) {
    set_async_logger(nullptr);
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const BalanceMonitor::Config::SystemConfig& config,
                                                               const std::string& log_file_path) {
    auto* ctx = g_logging_context.load();
    if (!ctx) {
        throw std::runtime_error("Logging context not set before initialization");
    }

    std::filesystem::path log_path(log_file_path);
    if (log_path.has_parent_path()) {
        std::error_code dir_error;
        std::filesystem::create_directories(log_path.parent_path(), dir_error);
        if (dir_error) {
            throw std::runtime_error("Failed to create log directory " + log_path.parent_path().string() + ": " + dir_error.message());
        }
    }

    ctx->minimum_level.store(static_cast<int>(parse_log_level(config.logging.level)));
    ctx->console_output.store(config.logging.console_output);

    auto logger = std::make_shared<AsyncLogger>(log_file_path);
    // Mark running before the consumer starts so early lines are queued, not lost
    logger->running.store(true);
    ctx->async_logger = logger;
    initialize_global_logger(*logger);
    set_log_thread_tag("MAIN  ");

    return logger;
}

std::mutex& get_console_mutex() {
    auto* ctx = g_logging_context.load();
    if (!ctx) {
        static std::mutex fallback;
        return fallback;
    }
    return ctx->console_mutex;
}

bool is_console_output_enabled() {
    auto* ctx = g_logging_context.load();
    return ctx ? ctx->console_output.load() : true;
}

void set_logging_context(LoggingContext& context) {
    g_logging_context.store(&context);
}

} // namespace Logging
} // namespace BalanceMonitor
