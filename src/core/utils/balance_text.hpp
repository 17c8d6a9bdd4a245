#ifndef BALANCE_TEXT_HPP
#define BALANCE_TEXT_HPP

#include <optional>
#include <string>

namespace BalanceMonitor {
namespace Utils {

// First number in free text ("$1,234.50 left" -> 1234.5); thousands separators are ignored.
std::optional<double> parse_first_number(const std::string& text);

// Display form used in results and the cache: "$" followed by one decimal.
std::string format_balance(double value);

std::string trim_copy(const std::string& text);
bool is_blank(const std::string& text);

} // namespace Utils
} // namespace BalanceMonitor

#endif // BALANCE_TEXT_HPP
