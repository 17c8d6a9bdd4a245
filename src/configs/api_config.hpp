#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace BalanceMonitor {
namespace Config {

struct ApiConfig {
    std::string base_url = "https://anyrouter.top";
    int timeout_seconds = 8;
    bool fallback_to_web = true;       // On probe failure run the slow check instead of serving the cache
    bool enable_ssl_verification = true;
};

} // namespace Config
} // namespace BalanceMonitor

#endif // API_CONFIG_HPP
