#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_DAY = 24LL * 60 * 60;

// Time format constants
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* DATE_ONLY = "%Y-%m-%d";

std::string get_current_human_readable_time();

// Local time with numeric offset, e.g. 2024-05-01T07:30:00+08:00
std::string format_rfc3339_local(std::chrono::system_clock::time_point time_point);
std::string get_current_rfc3339_local_time();

std::tm to_local_tm(std::chrono::system_clock::time_point time_point);
std::string format_date(const std::tm& local_time);
std::string format_month_start(const std::tm& local_time);

// Calendar arithmetic on YYYY-MM-DD strings; throws std::invalid_argument on malformed input
std::string shift_date_by_days(const std::string& date_text, int days);
bool is_valid_date(const std::string& date_text);

// Extracts the wall-clock date and hour as written in an RFC3339 or naive ISO timestamp
bool parse_timestamp_date_and_hour(const std::string& timestamp, std::string& date_out, int& hour_out);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
