#ifndef CHECK_RESULT_HPP
#define CHECK_RESULT_HPP

#include <string>
#include <vector>

namespace BalanceMonitor {
namespace Core {

enum class QueryMode {
    NORMAL,      // Fast probe first, slow check when forced or as fallback
    WEB_ONLY     // Slow check only
};

inline const char* query_mode_name(QueryMode mode) {
    return mode == QueryMode::WEB_ONLY ? "web_only" : "normal";
}

// Account id used for results that do not belong to one account
constexpr const char* SYSTEM_RESULT_USERNAME = "SYSTEM";

struct CheckResult {
    std::string username;
    bool success = false;
    std::string balance_text;
    std::string source;        // init, task, api, cache, web_hook, web_only or a probe tag
    std::string message;

    static CheckResult make(const std::string& username, bool success, const std::string& balance_text,
                            const std::string& source, const std::string& message) {
        CheckResult result;
        result.username = username;
        result.success = success;
        result.balance_text = balance_text;
        result.source = source;
        result.message = message;
        return result;
    }
};

struct BatchSummary {
    size_t total = 0;
    size_t success_count = 0;
    size_t failure_count = 0;
    long long elapsed_ms = 0;
    std::string finished_at;
    double total_balance = 0.0;
    size_t balance_count = 0;      // Results that contributed to total_balance
};

} // namespace Core
} // namespace BalanceMonitor

#endif // CHECK_RESULT_HPP
