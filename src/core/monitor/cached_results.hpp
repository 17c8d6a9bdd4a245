#ifndef CACHED_RESULTS_HPP
#define CACHED_RESULTS_HPP

#include <vector>
#include "check_result.hpp"
#include "core/accounts/account.hpp"
#include "core/state/state_store.hpp"

namespace BalanceMonitor {
namespace Core {

// One result per account from the balance cache; accounts never checked come back pending.
std::vector<CheckResult> build_cached_results(const std::vector<Account>& accounts, const StateStore& store);

// Totals over successful results whose balance text holds a number.
BatchSummary summarize_results(const std::vector<CheckResult>& results, long long elapsed_ms);

} // namespace Core
} // namespace BalanceMonitor

#endif // CACHED_RESULTS_HPP
