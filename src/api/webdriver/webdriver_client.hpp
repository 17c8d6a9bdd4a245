#ifndef WEBDRIVER_CLIENT_HPP
#define WEBDRIVER_CLIENT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "configs/browser_config.hpp"
#include "core/utils/attempt_deadline.hpp"

namespace BalanceMonitor {
namespace API {

using json = nlohmann::json;

class WebDriverError : public std::runtime_error {
public:
    explicit WebDriverError(const std::string& message) : std::runtime_error(message) {}
};

// W3C element reference key
constexpr const char* WEBDRIVER_ELEMENT_KEY = "element-6066-11e4-a52e-4f735466cecf";

// Chrome capabilities derived from the browser options.
json build_chrome_capabilities(const BalanceMonitor::Config::BrowserConfig& browser_config);

/**
 * One W3C WebDriver session on a leased worker.
 * Every command is bounded by the attempt deadline; an expired deadline raises
 * AttemptTimeoutError. The destructor deletes a still-open session.
 */
class WebDriverSession {
public:
    WebDriverSession(const std::string& worker_endpoint, const Utils::AttemptDeadline& attempt_deadline, long command_timeout_milliseconds);
    ~WebDriverSession();

    WebDriverSession(const WebDriverSession&) = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    void create(const json& capabilities);
    void quit();
    bool is_open() const { return !session_id.empty(); }

    void set_timeouts(long page_load_ms, long implicit_ms, long script_ms);
    void navigate(const std::string& url);
    std::string current_url();
    json execute_script(const std::string& script, const json& args = json::array());

    // Empty when no element matches
    std::optional<std::string> find_element(const std::string& strategy, const std::string& selector);
    void click(const std::string& element_id);
    void clear(const std::string& element_id);
    void send_keys(const std::string& element_id, const std::string& text);

private:
    std::string endpoint;
    const Utils::AttemptDeadline& deadline;
    long command_timeout_ms;
    std::string session_id;

    json send_command(const std::string& method, const std::string& path, const json& body, const std::string& step);
    json send_command_with_timeout(const std::string& method, const std::string& path, const json& body, long timeout_ms);
    std::string session_path(const std::string& suffix) const;
};

} // namespace API
} // namespace BalanceMonitor

#endif // WEBDRIVER_CLIENT_HPP
