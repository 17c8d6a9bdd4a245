#ifndef BROWSER_CONFIG_HPP
#define BROWSER_CONFIG_HPP

#include <string>

namespace BalanceMonitor {
namespace Config {

struct BrowserConfig {
    bool headless = true;
    int timeout_seconds = 20;              // Element and balance polling budget
    int page_load_timeout_seconds = 30;
    int implicitly_wait_seconds = 2;
    std::string window_size = "1920,1080";
    std::string user_agent;                // Empty keeps the driver default
    bool disable_images = true;
    bool disable_javascript = false;
};

} // namespace Config
} // namespace BalanceMonitor

#endif // BROWSER_CONFIG_HPP
