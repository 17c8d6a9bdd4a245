#include "cached_results.hpp"
#include "core/utils/balance_text.hpp"
#include "core/utils/time_utils.hpp"

namespace BalanceMonitor {
namespace Core {

std::vector<CheckResult> build_cached_results(const std::vector<Account>& accounts, const StateStore& store) {
    std::vector<CheckResult> results;
    results.reserve(accounts.size());
    for (const auto& account : accounts) {
        std::optional<BalanceRecord> record = store.get_cached_record(account.username);
        if (record && !Utils::is_blank(record->balance)) {
            std::string message = "cache updated at " + record->updated_at;
            if (record->sync_success.has_value()) {
                message += *record->sync_success ? ", sync ok" : ", sync failed";
                if (record->sync_message && !record->sync_message->empty()) {
                    message += " (" + *record->sync_message + ")";
                }
            }
            results.push_back(CheckResult::make(account.username, true, record->balance, "cache", message));
        } else {
            results.push_back(CheckResult::make(account.username, false, "pending", "cache", "no cached balance yet"));
        }
    }
    return results;
}

BatchSummary summarize_results(const std::vector<CheckResult>& results, long long elapsed_ms) {
    BatchSummary summary;
    summary.total = results.size();
    summary.elapsed_ms = elapsed_ms;
    summary.finished_at = TimeUtils::get_current_human_readable_time();
    for (const auto& result : results) {
        if (!result.success) {
            ++summary.failure_count;
            continue;
        }
        ++summary.success_count;
        if (auto amount = Utils::parse_first_number(result.balance_text)) {
            summary.total_balance += *amount;
            ++summary.balance_count;
        }
    }
    return summary;
}

} // namespace Core
} // namespace BalanceMonitor
