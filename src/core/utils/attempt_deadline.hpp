#ifndef ATTEMPT_DEADLINE_HPP
#define ATTEMPT_DEADLINE_HPP

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace BalanceMonitor {
namespace Utils {

class AttemptTimeoutError : public std::runtime_error {
public:
    explicit AttemptTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

// Wall-clock budget shared by every blocking step of one slow attempt.
class AttemptDeadline {
public:
    explicit AttemptDeadline(std::chrono::milliseconds budget_duration)
        : budget(budget_duration), deadline(std::chrono::steady_clock::now() + budget_duration) {}

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }

    void check(const std::string& step) const {
        if (expired()) {
            throw AttemptTimeoutError("deadline of " + std::to_string(budget_seconds()) + "s exceeded during " + step);
        }
    }

    // Per-call timeout that never runs past the deadline.
    long bound_timeout_ms(long requested_ms, const std::string& step) const {
        check(step);
        long left = static_cast<long>(remaining().count());
        return std::max(1L, std::min(requested_ms, left));
    }

    long long budget_seconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(budget).count();
    }

private:
    std::chrono::milliseconds budget;
    std::chrono::steady_clock::time_point deadline;
};

} // namespace Utils
} // namespace BalanceMonitor

#endif // ATTEMPT_DEADLINE_HPP
