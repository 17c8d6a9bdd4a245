#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>

namespace BalanceMonitor {
namespace Testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device seed;
        std::ostringstream name;
        name << "balance_monitor_test_" << ::getpid() << "_" << seed();
        dir_path = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(dir_path);
    }

    ~TempDir() {
        std::error_code ignored;
        std::filesystem::remove_all(dir_path, ignored);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (dir_path / name).string(); }
    const std::filesystem::path& path() const { return dir_path; }

private:
    std::filesystem::path dir_path;
};

inline void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Local wall-clock time as a system_clock point.
inline std::chrono::system_clock::time_point local_time_point(int year, int month, int day, int hour, int minute = 0) {
    std::tm local = {};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = hour;
    local.tm_min = minute;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

inline std::tm local_tm(int year, int month, int day, int hour) {
    std::tm local = {};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = hour;
    local.tm_isdst = -1;
    return local;
}

} // namespace Testing
} // namespace BalanceMonitor

#endif // TEST_HELPERS_HPP
