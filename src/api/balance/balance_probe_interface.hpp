#ifndef BALANCE_PROBE_INTERFACE_HPP
#define BALANCE_PROBE_INTERFACE_HPP

#include <memory>
#include <optional>
#include <string>

namespace BalanceMonitor {
namespace API {

struct ProbeResult {
    bool success = false;
    std::optional<double> balance;
    std::string source;        // e.g. "billing:subscription+usage", "header:/api/user/self"
    std::string message;

    static ProbeResult ok(double balance_value, const std::string& source_tag, const std::string& message_text) {
        ProbeResult result;
        result.success = true;
        result.balance = balance_value;
        result.source = source_tag;
        result.message = message_text;
        return result;
    }

    static ProbeResult fail(const std::string& message_text) {
        ProbeResult result;
        result.source = "api";
        result.message = message_text;
        return result;
    }
};

// Fast, structured-API balance lookup keyed by an account's token.
class FastBalanceProbe {
public:
    virtual ~FastBalanceProbe() = default;
    virtual ProbeResult probe(const std::string& api_key) = 0;
};

using FastBalanceProbePtr = std::shared_ptr<FastBalanceProbe>;

} // namespace API
} // namespace BalanceMonitor

#endif // BALANCE_PROBE_INTERFACE_HPP
