/**
 * Logging thread.
 * Drains the AsyncLogger queue into the log file and the console.
 */
#include "logging_thread.hpp"
#include <iostream>
#include <chrono>
#include <thread>

using namespace BalanceMonitor::Threads;
using namespace BalanceMonitor::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    set_log_thread_tag("LOGGER");
    try {
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        std::lock_guard<std::mutex> cguard(get_console_mutex());
        std::cerr << "LoggingThread exception: " << exception.what() << std::endl;
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::lock_guard<std::mutex> cguard(get_console_mutex());
        std::cerr << "LoggingThread could not open " << logger_ptr->get_file_path() << ", console only" << std::endl;
    }

    std::vector<std::string> message_buffer;
    while (logger_ptr->running.load()) {
        wait_and_collect_messages(message_buffer);
        if (!message_buffer.empty()) {
            flush_message_buffer(message_buffer, log_file);
        }
    }

    // Drain whatever was queued before stop()
    {
        std::lock_guard<std::mutex> lock(logger_ptr->mtx);
        while (!logger_ptr->queue.empty()) {
            message_buffer.push_back(std::move(logger_ptr->queue.front()));
            logger_ptr->queue.pop();
        }
    }
    flush_message_buffer(message_buffer, log_file);
}

// ========================================================================
// QUEUE PROCESSING
// ========================================================================

void LoggingThread::wait_and_collect_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(logger_ptr->mtx);

    // Wake periodically so a stop() is noticed even when the queue stays empty
    auto timeout_duration = std::chrono::milliseconds(config.flush_interval_ms > 0 ? config.flush_interval_ms : 200);
    logger_ptr->cv.wait_for(lock, timeout_duration, [&]{ return !logger_ptr->queue.empty() || !logger_ptr->running.load(); });

    while (!logger_ptr->queue.empty()) {
        message_buffer.push_back(std::move(logger_ptr->queue.front()));
        logger_ptr->queue.pop();
    }
}

void LoggingThread::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line(log_line, log_file);
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
    flush_count.fetch_add(1);
}

// ========================================================================
// OUTPUT PROCESSING
// ========================================================================

void LoggingThread::output_log_line(const std::string& log_line, std::ofstream& log_file) {
    if (is_console_output_enabled()) {
        std::lock_guard<std::mutex> cguard(get_console_mutex());
        std::cout << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
    }
}
