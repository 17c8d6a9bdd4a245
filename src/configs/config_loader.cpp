#include "config_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <cstdio>
#include <vector>
#include <filesystem>

namespace BalanceMonitor {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }

    int to_int(const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
            }
            return parsed;
        } catch (const std::invalid_argument&) {
            throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
        } catch (const std::out_of_range&) {
            throw ConfigError("Integer out of range for " + key + ": '" + value + "'");
        }
    }

    std::vector<std::string> split_args(const std::string& value) {
        std::vector<std::string> parts;
        std::stringstream ss(value);
        std::string part;
        while (std::getline(ss, part, '|')) {
            part = trim(part);
            if (!part.empty()) parts.push_back(part);
        }
        return parts;
    }

    std::string to_upper(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), ::toupper);
        return value;
    }
}

std::string resolve_config_dir(const std::string& cli_config_dir) {
    if (!trim(cli_config_dir).empty()) {
        return trim(cli_config_dir);
    }
    const char* env_home = std::getenv("BALANCE_MONITOR_HOME");
    if (env_home && !trim(env_home).empty()) {
        return trim(env_home);
    }
    return "config";
}

RuntimePaths build_runtime_paths(const std::string& config_dir, const SystemConfig& config) {
    std::filesystem::path dir(config_dir);
    RuntimePaths paths;
    paths.config_dir = dir.string();
    paths.config_file = (dir / "runtime_config.csv").string();
    paths.credentials_file = (dir / "credentials.txt").string();
    paths.balance_cache_file = (dir / "balance_cache.json").string();
    paths.cycle_state_file = (dir / "daily_web_login_state.json").string();

    std::filesystem::path log_path(config.logging.log_file);
    paths.log_file = log_path.is_absolute() ? log_path.string() : (dir / log_path).string();
    return paths;
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream in(csv_path);
    if (!in.is_open()) return false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::stringstream ss(line);
        std::string key, value;
        if (!std::getline(ss, key, ',')) continue;
        if (!std::getline(ss, value)) value.clear();
        key = trim(key); value = trim(value);

        // Performance
        if (key == "performance.max_workers") cfg.performance.max_workers = to_int(key, value);
        else if (key == "performance.query_interval_sec") cfg.performance.query_interval_sec = to_int(key, value);
        else if (key == "performance.retry_times") cfg.performance.retry_times = to_int(key, value);
        else if (key == "performance.retry_delay_sec") cfg.performance.retry_delay_sec = to_int(key, value);
        else if (key == "performance.daily_rollover_hour") cfg.performance.daily_rollover_hour = to_int(key, value);

        // API
        else if (key == "api.base_url") cfg.api.base_url = value;
        else if (key == "api.timeout_seconds") cfg.api.timeout_seconds = to_int(key, value);
        else if (key == "api.fallback_to_web") cfg.api.fallback_to_web = to_bool(value);
        else if (key == "api.enable_ssl_verification") cfg.api.enable_ssl_verification = to_bool(value);

        // Browser
        else if (key == "browser.headless") cfg.browser.headless = to_bool(value);
        else if (key == "browser.timeout_seconds") cfg.browser.timeout_seconds = to_int(key, value);
        else if (key == "browser.page_load_timeout_seconds") cfg.browser.page_load_timeout_seconds = to_int(key, value);
        else if (key == "browser.implicitly_wait_seconds") cfg.browser.implicitly_wait_seconds = to_int(key, value);
        else if (key == "browser.window_size") {
            // The value itself contains a comma, so take the remainder of the line
            cfg.browser.window_size = trim(line.substr(line.find(',') + 1));
        }
        else if (key == "browser.user_agent") cfg.browser.user_agent = trim(line.substr(line.find(',') + 1));
        else if (key == "browser.disable_images") cfg.browser.disable_images = to_bool(value);
        else if (key == "browser.disable_javascript") cfg.browser.disable_javascript = to_bool(value);

        // Web check
        else if (key == "web_check.enabled") cfg.web_check.enabled = to_bool(value);
        else if (key == "web_check.command") cfg.web_check.command = value;
        else if (key == "web_check.args") cfg.web_check.args = split_args(trim(line.substr(line.find(',') + 1)));
        else if (key == "web_check.timeout_seconds") cfg.web_check.timeout_seconds = to_int(key, value);
        else if (key == "web_check.driver_path") cfg.web_check.driver_path = value;
        else if (key == "web_check.driver_cache_dir") cfg.web_check.driver_cache_dir = value;
        else if (key == "web_check.pool_size") cfg.web_check.pool_size = to_int(key, value);
        else if (key == "web_check.max_pool_size") cfg.web_check.max_pool_size = to_int(key, value);
        else if (key == "web_check.acquire_timeout_seconds") cfg.web_check.acquire_timeout_seconds = to_int(key, value);
        else if (key == "web_check.acquire_poll_interval_ms") cfg.web_check.acquire_poll_interval_ms = to_int(key, value);
        else if (key == "web_check.port_ready_timeout_ms") cfg.web_check.port_ready_timeout_ms = to_int(key, value);
        else if (key == "web_check.console_url") cfg.web_check.console_url = value;

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.level") cfg.logging.level = to_upper(value);
        else if (key == "logging.console_output") cfg.logging.console_output = to_bool(value);
        else if (key == "logging.flush_interval_ms") cfg.logging.flush_interval_ms = to_int(key, value);

        // Metrics
        else if (key == "metrics.history_size") cfg.metrics.history_size = to_int(key, value);
        else if (key == "metrics.slow_operation_threshold_ms") cfg.metrics.slow_operation_threshold_ms = to_int(key, value);
    }
    return true;
}

SystemConfig load_system_config(const std::string& config_dir) {
    SystemConfig config;
    std::string config_path = (std::filesystem::path(config_dir) / "runtime_config.csv").string();
    if (!load_config_from_csv(config, config_path)) {
        fprintf(stderr, "Config CSV not found at %s, using defaults\n", config_path.c_str());
    }

    std::string cfg_error;
    if (!validate_config(config, cfg_error)) {
        throw ConfigError("Config error in " + config_path + ": " + cfg_error);
    }
    return config;
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    if (trim(config.api.base_url).empty()) {
        errorMessage = "api.base_url is empty";
        return false;
    }
    if (config.api.timeout_seconds <= 0 || config.web_check.timeout_seconds <= 0 || config.browser.timeout_seconds <= 0) {
        errorMessage = "timeout seconds must be > 0";
        return false;
    }
    if (config.performance.daily_rollover_hour < 0 || config.performance.daily_rollover_hour > 23) {
        errorMessage = "performance.daily_rollover_hour must be between 0 and 23";
        return false;
    }
    if (config.performance.max_workers < 1) {
        errorMessage = "performance.max_workers must be >= 1";
        return false;
    }
    if (config.performance.retry_times < 1 || config.performance.retry_delay_sec < 0) {
        errorMessage = "performance.retry_times must be >= 1 and retry_delay_sec >= 0";
        return false;
    }
    if (config.performance.query_interval_sec <= 0) {
        errorMessage = "performance.query_interval_sec must be > 0";
        return false;
    }
    if (config.web_check.pool_size < 1 || config.web_check.max_pool_size < 1) {
        errorMessage = "web_check.pool_size and web_check.max_pool_size must be >= 1";
        return false;
    }
    if (config.web_check.acquire_timeout_seconds <= 0 || config.web_check.port_ready_timeout_ms <= 0) {
        errorMessage = "web_check acquire and port readiness timeouts must be > 0";
        return false;
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "logging.log_file is empty";
        return false;
    }
    const std::string& level = config.logging.level;
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        errorMessage = "logging.level must be one of DEBUG, INFO, WARN, ERROR";
        return false;
    }
    if (config.metrics.history_size < 1) {
        errorMessage = "metrics.history_size must be >= 1";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace BalanceMonitor
