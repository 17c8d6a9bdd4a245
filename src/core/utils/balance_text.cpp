#include "balance_text.hpp"
#include <regex>
#include <cstdio>
#include <cmath>
#include <stdexcept>

namespace BalanceMonitor {
namespace Utils {

std::optional<double> parse_first_number(const std::string& text) {
    static const std::regex number_pattern(R"(-?[\d,]+(?:\.\d+)?)");
    std::smatch match;
    if (!std::regex_search(text, match, number_pattern)) {
        return std::nullopt;
    }

    std::string digits;
    for (char c : match.str(0)) {
        if (c != ',') digits.push_back(c);
    }
    if (digits.empty() || digits == "-") {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(digits, &consumed);
        if (consumed != digits.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string format_balance(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "$%.1f", value);
    return buffer;
}

std::string trim_copy(const std::string& text) {
    const char* ws = " \t\r\n";
    auto b = text.find_first_not_of(ws);
    auto e = text.find_last_not_of(ws);
    if (b == std::string::npos) return "";
    return text.substr(b, e - b + 1);
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace Utils
} // namespace BalanceMonitor
