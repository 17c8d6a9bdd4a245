#include "time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <cstdio>
#include <stdexcept>

namespace TimeUtils {

namespace {
    bool parse_date_fields(const std::string& date_text, int& year, int& month, int& day) {
        if (date_text.size() != 10 || date_text[4] != '-' || date_text[7] != '-') {
            return false;
        }
        for (size_t i = 0; i < date_text.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (date_text[i] < '0' || date_text[i] > '9') return false;
        }
        year = std::stoi(date_text.substr(0, 4));
        month = std::stoi(date_text.substr(5, 2));
        day = std::stoi(date_text.substr(8, 2));
        return true;
    }
}

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::tm to_local_tm(std::chrono::system_clock::time_point time_point) {
    auto in_time_t = std::chrono::system_clock::to_time_t(time_point);
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    return timeinfo;
}

std::string format_rfc3339_local(std::chrono::system_clock::time_point time_point) {
    std::tm timeinfo = to_local_tm(time_point);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITHOUT_Z);

    // %z gives +0800, RFC3339 wants +08:00
    char offset_buffer[8] = {0};
    std::strftime(offset_buffer, sizeof(offset_buffer), "%z", &timeinfo);
    std::string offset(offset_buffer);
    if (offset.size() == 5) {
        ss << offset.substr(0, 3) << ":" << offset.substr(3, 2);
    } else {
        ss << "Z";
    }
    return ss.str();
}

std::string get_current_rfc3339_local_time() {
    return format_rfc3339_local(std::chrono::system_clock::now());
}

std::string format_date(const std::tm& local_time) {
    std::stringstream ss;
    ss << std::put_time(&local_time, DATE_ONLY);
    return ss.str();
}

std::string format_month_start(const std::tm& local_time) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-01", local_time.tm_year + 1900, local_time.tm_mon + 1);
    return buffer;
}

bool is_valid_date(const std::string& date_text) {
    int year = 0, month = 0, day = 0;
    if (!parse_date_fields(date_text, year, month, day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    // Round-trip through mktime to reject dates such as 2024-02-31
    std::tm probe{};
    probe.tm_year = year - 1900;
    probe.tm_mon = month - 1;
    probe.tm_mday = day;
    probe.tm_hour = 12;
    probe.tm_isdst = -1;
    if (std::mktime(&probe) == static_cast<std::time_t>(-1)) {
        return false;
    }
    return probe.tm_year == year - 1900 && probe.tm_mon == month - 1 && probe.tm_mday == day;
}

std::string shift_date_by_days(const std::string& date_text, int days) {
    if (!is_valid_date(date_text)) {
        throw std::invalid_argument("Invalid date: " + date_text);
    }
    int year = 0, month = 0, day = 0;
    parse_date_fields(date_text, year, month, day);

    // Noon keeps DST transitions from moving the result across a day boundary
    std::tm shifted{};
    shifted.tm_year = year - 1900;
    shifted.tm_mon = month - 1;
    shifted.tm_mday = day + days;
    shifted.tm_hour = 12;
    shifted.tm_isdst = -1;
    std::mktime(&shifted);
    return format_date(shifted);
}

bool parse_timestamp_date_and_hour(const std::string& timestamp, std::string& date_out, int& hour_out) {
    if (timestamp.size() < 19) {
        return false;
    }
    std::string date_part = timestamp.substr(0, 10);
    char separator = timestamp[10];
    if ((separator != 'T' && separator != 't' && separator != ' ') || !is_valid_date(date_part)) {
        return false;
    }
    int hour = -1, minute = -1, second = -1;
    if (std::sscanf(timestamp.c_str() + 11, "%2d:%2d:%2d", &hour, &minute, &second) != 3) {
        return false;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return false;
    }
    date_out = date_part;
    hour_out = hour;
    return true;
}

} // namespace TimeUtils
