#ifndef WEB_CHECK_CONFIG_HPP
#define WEB_CHECK_CONFIG_HPP

#include <string>
#include <vector>

namespace BalanceMonitor {
namespace Config {

struct WebCheckConfig {
    // External hook command (used instead of the native flow when enabled)
    bool enabled = false;
    std::string command;
    std::vector<std::string> args;         // Supports {username}, {password}, {api_key}

    int timeout_seconds = 90;              // Whole slow check including retries

    // Worker process pool
    std::string driver_path;
    std::string driver_cache_dir;
    int pool_size = 4;
    int max_pool_size = 9;
    int acquire_timeout_seconds = 20;
    int acquire_poll_interval_ms = 120;
    int port_ready_timeout_ms = 8000;

    std::string console_url = "https://anyrouter.top/console";
};

} // namespace Config
} // namespace BalanceMonitor

#endif // WEB_CHECK_CONFIG_HPP
