#include "driver_locator.hpp"
#include "core/logging/logging_macros.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace BalanceMonitor {
namespace Browser {

namespace {
    bool is_executable_file(const std::filesystem::path& candidate) {
        std::error_code status_error;
        return std::filesystem::is_regular_file(candidate, status_error) && ::access(candidate.c_str(), X_OK) == 0;
    }

    std::optional<std::string> search_cache_dir(const std::string& cache_dir) {
        std::error_code iteration_error;
        if (cache_dir.empty() || !std::filesystem::is_directory(cache_dir, iteration_error)) {
            return std::nullopt;
        }
        std::filesystem::recursive_directory_iterator it(cache_dir, std::filesystem::directory_options::skip_permission_denied, iteration_error);
        std::filesystem::recursive_directory_iterator end;
        for (; !iteration_error && it != end; it.increment(iteration_error)) {
            if (it->path().filename() == DRIVER_EXECUTABLE_NAME && is_executable_file(it->path())) {
                return it->path().string();
            }
        }
        return std::nullopt;
    }
}

std::optional<std::string> find_executable_in_path(const std::string& executable_name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }
    std::stringstream ss(path_env);
    std::string directory;
    while (std::getline(ss, directory, ':')) {
        if (directory.empty()) continue;
        std::filesystem::path candidate = std::filesystem::path(directory) / executable_name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> locate_driver_executable(const BalanceMonitor::Config::WebCheckConfig& web_check_config) {
    if (!web_check_config.driver_path.empty()) {
        if (is_executable_file(web_check_config.driver_path)) {
            return web_check_config.driver_path;
        }
        LOG_WARN("Configured driver_path is not an executable file: " + web_check_config.driver_path);
    }

    std::optional<std::string> cached = search_cache_dir(web_check_config.driver_cache_dir);
    if (cached) {
        return cached;
    }

    return find_executable_in_path(DRIVER_EXECUTABLE_NAME);
}

} // namespace Browser
} // namespace BalanceMonitor
