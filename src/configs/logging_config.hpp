// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace BalanceMonitor {
namespace Config {

struct LoggingConfig {
    std::string log_file = "balance_monitor.log";
    std::string level = "INFO";
    bool console_output = true;
    int flush_interval_ms = 200;
};

} // namespace Config
} // namespace BalanceMonitor

#endif // LOGGING_CONFIG_HPP
