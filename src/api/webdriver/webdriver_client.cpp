#include "webdriver_client.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/http_utils.hpp"
#include <algorithm>

namespace BalanceMonitor {
namespace API {

namespace {
    constexpr long SESSION_QUIT_TIMEOUT_MS = 5000;
}

json build_chrome_capabilities(const BalanceMonitor::Config::BrowserConfig& browser_config) {
    json args = json::array({
        "--disable-gpu",
        "--no-sandbox",
        "--disable-dev-shm-usage",
        "--disable-extensions",
        "--disable-notifications",
        "--disable-blink-features=AutomationControlled",
        "--log-level=3"
    });
    if (browser_config.headless) {
        args.push_back("--headless=new");
    }
    if (!browser_config.window_size.empty()) {
        args.push_back("--window-size=" + browser_config.window_size);
    }
    if (!browser_config.user_agent.empty()) {
        args.push_back("--user-agent=" + browser_config.user_agent);
    }

    json chrome_options;
    chrome_options["args"] = args;
    json prefs = json::object();
    if (browser_config.disable_images) {
        prefs["profile.managed_default_content_settings.images"] = 2;
    }
    if (browser_config.disable_javascript) {
        prefs["profile.managed_default_content_settings.javascript"] = 2;
    }
    if (!prefs.empty()) {
        chrome_options["prefs"] = prefs;
    }

    json always_match;
    always_match["browserName"] = "chrome";
    always_match["goog:chromeOptions"] = chrome_options;

    json capabilities;
    capabilities["capabilities"]["alwaysMatch"] = always_match;
    return capabilities;
}

WebDriverSession::WebDriverSession(const std::string& worker_endpoint, const Utils::AttemptDeadline& attempt_deadline, long command_timeout_milliseconds)
    : endpoint(worker_endpoint), deadline(attempt_deadline), command_timeout_ms(command_timeout_milliseconds) {}

WebDriverSession::~WebDriverSession() {
    try {
        quit();
    } catch (const std::exception& quit_error) {
        LOG_WARN("Failed to close WebDriver session on " + endpoint + ": " + quit_error.what());
    }
}

std::string WebDriverSession::session_path(const std::string& suffix) const {
    if (session_id.empty()) {
        throw WebDriverError("No WebDriver session open on " + endpoint);
    }
    return "/session/" + session_id + suffix;
}

// ========================================================================
// COMMAND TRANSPORT
// ========================================================================

json WebDriverSession::send_command(const std::string& method, const std::string& path, const json& body, const std::string& step) {
    long timeout_ms = deadline.bound_timeout_ms(command_timeout_ms, step);
    try {
        return send_command_with_timeout(method, path, body, timeout_ms);
    } catch (const WebDriverError&) {
        // A transport timeout caused by the deadline is reported as the deadline
        deadline.check(step);
        throw;
    }
}

json WebDriverSession::send_command_with_timeout(const std::string& method, const std::string& path, const json& body, long timeout_ms) {
    std::string url = join_url(endpoint, path);
    HttpResponse response;
    if (method == "POST") {
        response = http_post(url, body.is_null() ? "{}" : body.dump(), timeout_ms);
    } else if (method == "DELETE") {
        response = http_delete(url, timeout_ms);
    } else {
        response = http_get(url, {"Accept: application/json"}, timeout_ms, false);
    }

    if (!response.transport_ok) {
        throw WebDriverError("WebDriver " + method + " " + path + " failed: " + response.error_message);
    }

    json document = json::parse(response.body, nullptr, false);
    if (document.is_discarded()) {
        throw WebDriverError("WebDriver " + method + " " + path + " returned non-JSON (HTTP " + std::to_string(response.status_code) + ")");
    }

    json value = document.contains("value") ? document["value"] : json();
    if (response.status_code >= 400 || (value.is_object() && value.contains("error"))) {
        std::string error_name = value.is_object() && value.contains("error") && value["error"].is_string()
                                     ? value["error"].get<std::string>() : "unknown error";
        std::string error_text = value.is_object() && value.contains("message") && value["message"].is_string()
                                     ? value["message"].get<std::string>() : "";
        throw WebDriverError(error_name + (error_text.empty() ? "" : ": " + error_text.substr(0, 300)));
    }
    return value;
}

// ========================================================================
// SESSION COMMANDS
// ========================================================================

void WebDriverSession::create(const json& capabilities) {
    json value = send_command("POST", "/session", capabilities, "session creation");
    if (!value.is_object() || !value.contains("sessionId") || !value["sessionId"].is_string()) {
        throw WebDriverError("New session response has no sessionId");
    }
    session_id = value["sessionId"].get<std::string>();
}

void WebDriverSession::quit() {
    if (session_id.empty()) {
        return;
    }
    std::string path = "/session/" + session_id;
    session_id.clear();
    // Runs even after the attempt deadline so the worker is left clean
    send_command_with_timeout("DELETE", path, json(), SESSION_QUIT_TIMEOUT_MS);
}

void WebDriverSession::set_timeouts(long page_load_ms, long implicit_ms, long script_ms) {
    json body;
    body["pageLoad"] = page_load_ms;
    body["implicit"] = implicit_ms;
    body["script"] = script_ms;
    send_command("POST", session_path("/timeouts"), body, "timeout setup");
}

void WebDriverSession::navigate(const std::string& url) {
    json body;
    body["url"] = url;
    send_command("POST", session_path("/url"), body, "navigation to " + url);
}

std::string WebDriverSession::current_url() {
    json value = send_command("GET", session_path("/url"), json(), "url lookup");
    return value.is_string() ? value.get<std::string>() : "";
}

json WebDriverSession::execute_script(const std::string& script, const json& args) {
    json body;
    body["script"] = script;
    body["args"] = args;
    return send_command("POST", session_path("/execute/sync"), body, "script execution");
}

std::optional<std::string> WebDriverSession::find_element(const std::string& strategy, const std::string& selector) {
    json body;
    body["using"] = strategy;
    body["value"] = selector;
    try {
        json value = send_command("POST", session_path("/element"), body, "element lookup");
        if (value.is_object() && value.contains(WEBDRIVER_ELEMENT_KEY)) {
            return value[WEBDRIVER_ELEMENT_KEY].get<std::string>();
        }
        return std::nullopt;
    } catch (const WebDriverError& lookup_error) {
        std::string text = lookup_error.what();
        if (text.rfind("no such element", 0) == 0) {
            return std::nullopt;
        }
        throw;
    }
}

void WebDriverSession::click(const std::string& element_id) {
    send_command("POST", session_path("/element/" + element_id + "/click"), json::object(), "click");
}

void WebDriverSession::clear(const std::string& element_id) {
    send_command("POST", session_path("/element/" + element_id + "/clear"), json::object(), "clear");
}

void WebDriverSession::send_keys(const std::string& element_id, const std::string& text) {
    json body;
    body["text"] = text;
    send_command("POST", session_path("/element/" + element_id + "/value"), body, "text entry");
}

} // namespace API
} // namespace BalanceMonitor
