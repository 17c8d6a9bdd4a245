#ifndef DRIVER_LOCATOR_HPP
#define DRIVER_LOCATOR_HPP

#include <optional>
#include <string>
#include "configs/web_check_config.hpp"

namespace BalanceMonitor {
namespace Browser {

constexpr const char* DRIVER_EXECUTABLE_NAME = "chromedriver";

// Configured path, then a search of the driver cache directory, then PATH.
std::optional<std::string> locate_driver_executable(const BalanceMonitor::Config::WebCheckConfig& web_check_config);

std::optional<std::string> find_executable_in_path(const std::string& executable_name);

} // namespace Browser
} // namespace BalanceMonitor

#endif // DRIVER_LOCATOR_HPP
