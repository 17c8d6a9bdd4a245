#ifndef WEB_CHECK_RESULT_HPP
#define WEB_CHECK_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace BalanceMonitor {
namespace WebCheck {

struct WebCheckResult {
    bool success = false;
    std::optional<double> balance;
    std::string message;
    std::optional<bool> sync_success;            // Secondary sync step, when the strategy ran one
    std::optional<std::string> sync_message;
};

// Command- or infrastructure-level failure of a slow check (no worker, driver unreachable, hook crashed).
class WebCheckError : public std::runtime_error {
public:
    explicit WebCheckError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace WebCheck
} // namespace BalanceMonitor

#endif // WEB_CHECK_RESULT_HPP
