#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "logger/async_logger.hpp"
#include <string>

// Standard indentation levels
#define LOG_INDENT_L0 ""              // No indentation
#define LOG_INDENT_L1 "        "      // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "  // Content level

// Leveled messages
#define LOG_DEBUG(msg) BalanceMonitor::Logging::log_leveled_message(BalanceMonitor::Logging::LogLevel::DEBUG, std::string(msg))
#define LOG_INFO(msg) BalanceMonitor::Logging::log_leveled_message(BalanceMonitor::Logging::LogLevel::INFO, std::string(msg))
#define LOG_WARN(msg) BalanceMonitor::Logging::log_leveled_message(BalanceMonitor::Logging::LogLevel::WARN, std::string(msg))
#define LOG_ERROR(msg) BalanceMonitor::Logging::log_leveled_message(BalanceMonitor::Logging::LogLevel::ERROR, std::string(msg))

// Section headers and footers
#define LOG_SECTION_HEADER(title) BalanceMonitor::Logging::log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() BalanceMonitor::Logging::log_message(LOG_INDENT_L1 "+--", "")

// Content logging macros
#define LOG_CONTENT(msg) BalanceMonitor::Logging::log_message(LOG_INDENT_L2 + std::string(msg), "")

// Batch header (special case - no indentation)
#define LOG_BATCH_HEADER(batch_num, mode_name) \
    BalanceMonitor::Logging::log_message("", ""); \
    BalanceMonitor::Logging::log_message("================================================================================", ""); \
    BalanceMonitor::Logging::log_message("                         BALANCE BATCH #" + std::to_string(batch_num) + " - " + std::string(mode_name), ""); \
    BalanceMonitor::Logging::log_message("================================================================================", ""); \
    BalanceMonitor::Logging::log_message("", "")

#define LOG_MESSAGE_BAR() \
    BalanceMonitor::Logging::log_message("================================================================================", ""); \
    BalanceMonitor::Logging::log_message("", "")

// Table rows for result listings
#define LOG_TABLE_SEPARATOR() LOG_CONTENT("------------------------+---------+--------------+----------------------------------")
#define LOG_RESULT_ROW(username, status, balance, source) \
    LOG_CONTENT(BalanceMonitor::Logging::pad_column(username, 24) + "| " + BalanceMonitor::Logging::pad_column(status, 8) + "| " + \
                BalanceMonitor::Logging::pad_column(balance, 13) + "| " + std::string(source))

namespace BalanceMonitor {
namespace Logging {

inline std::string pad_column(const std::string& value, size_t width) {
    if (value.size() >= width) {
        return value.substr(0, width);
    }
    return value + std::string(width - value.size(), ' ');
}

} // namespace Logging
} // namespace BalanceMonitor

#endif // LOGGING_MACROS_HPP
