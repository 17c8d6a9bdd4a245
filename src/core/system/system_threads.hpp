#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <chrono>
#include <thread>

/**
 * @brief System thread handles
 *
 * Check threads are per batch and owned by the orchestrator; only the logger lives for the whole run.
 */
struct SystemThreads {
    std::thread logger;
    std::chrono::steady_clock::time_point start_time;

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;

    SystemThreads(SystemThreads&& other) noexcept
        : logger(std::move(other.logger)), start_time(other.start_time) {}

    SystemThreads& operator=(SystemThreads&& other) noexcept {
        if (this != &other) {
            logger = std::move(other.logger);
            start_time = other.start_time;
        }
        return *this;
    }
};

#endif // SYSTEM_THREADS_HPP
