#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <stdexcept>
#include "system_config.hpp"

namespace BalanceMonitor {
namespace Config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Files that live in the configuration directory.
struct RuntimePaths {
    std::string config_dir;
    std::string config_file;           // runtime_config.csv
    std::string credentials_file;      // credentials.txt
    std::string balance_cache_file;    // balance_cache.json
    std::string cycle_state_file;      // daily_web_login_state.json
    std::string log_file;
};

// --config-dir argument, else BALANCE_MONITOR_HOME, else ./config
std::string resolve_config_dir(const std::string& cli_config_dir);

RuntimePaths build_runtime_paths(const std::string& config_dir, const SystemConfig& config);

// Load key,value CSV into SystemConfig. Unknown keys are ignored, malformed values throw ConfigError.
// Returns false when the file cannot be opened.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Load runtime_config.csv from the directory (defaults when absent) and validate it.
SystemConfig load_system_config(const std::string& config_dir);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

} // namespace Config
} // namespace BalanceMonitor

#endif // CONFIG_LOADER_HPP
