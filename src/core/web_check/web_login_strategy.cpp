#include "web_login_strategy.hpp"
#include "web_login_scripts.hpp"
#include "api/webdriver/webdriver_client.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace BalanceMonitor {
namespace WebCheck {

using API::WebDriverSession;
using API::WebDriverError;
using Utils::AttemptDeadline;
using API::json;

namespace {
    constexpr long COMMAND_TIMEOUT_MS = 30000;
    constexpr int FIELD_WAIT_MS = 5000;
    constexpr int FIELD_POLL_MS = 200;
    constexpr int SKELETON_WAIT_MS = 10000;
    constexpr int EXTRACT_POLL_MS = 500;

    // Sleep that never outlives the attempt deadline
    void pause(const AttemptDeadline& deadline, int milliseconds, const std::string& step) {
        auto wait = std::min(std::chrono::milliseconds(milliseconds), deadline.remaining());
        std::this_thread::sleep_for(wait);
        deadline.check(step);
    }

    bool url_is_console(const std::string& url) {
        return url.find("/console") != std::string::npos && url.find("/login") == std::string::npos;
    }
}

WebCheckResult WebLoginStrategy::run_once(const Core::Account& account,
                                          const std::string& worker_endpoint,
                                          const BalanceMonitor::Config::BrowserConfig& browser_config,
                                          const AttemptDeadline& deadline) {
    auto flow_started = std::chrono::steady_clock::now();
    WebDriverSession session(worker_endpoint, deadline, COMMAND_TIMEOUT_MS);
    session.create(API::build_chrome_capabilities(browser_config));
    session.set_timeouts(static_cast<long>(std::max(1, browser_config.page_load_timeout_seconds)) * 1000L,
                         static_cast<long>(std::max(0, browser_config.implicitly_wait_seconds)) * 1000L,
                         COMMAND_TIMEOUT_MS);

    session.navigate(console_url);
    pause(deadline, 800, "console navigation");

    if (session.current_url().find("/login") != std::string::npos) {
        pause(deadline, 500, "login page");
        session.execute_script(Scripts::CLOSE_ANNOUNCEMENT_POPUP);
        submit_login_form(session, account, deadline);
        session.navigate(console_url);
        pause(deadline, 800, "console navigation after login");
    }

    std::string logged_url = session.current_url();
    LOG_DEBUG("[" + account.username + "] url after login: " + logged_url);
    if (!url_is_console(logged_url)) {
        std::string error_text = read_login_error(session);
        if (!error_text.empty()) {
            throw WebDriverError("login failed: " + error_text + " (url: " + logged_url + ")");
        }
        throw WebDriverError("login failed, url: " + logged_url);
    }

    std::string balance_text = extract_balance_text(session, std::max(3, browser_config.timeout_seconds), deadline);
    std::optional<double> balance = Utils::parse_first_number(balance_text);
    if (!balance) {
        throw WebDriverError("balance text is not a number: " + balance_text);
    }

    session.quit();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - flow_started);
    LOG_DEBUG("[" + account.username + "] login flow finished in " + std::to_string(elapsed.count()) + "ms");

    WebCheckResult result;
    result.success = true;
    result.balance = *balance;
    result.message = "web login succeeded";
    return result;
}

void WebLoginStrategy::submit_login_form(WebDriverSession& session, const Core::Account& account, const AttemptDeadline& deadline) {
    std::optional<std::string> mail_button = session.find_element("css selector", "button[type='button'] span.semi-icon-mail");
    if (mail_button) {
        json args = json::array({ json{{API::WEBDRIVER_ELEMENT_KEY, *mail_button}} });
        session.execute_script(Scripts::CLICK_ARGUMENT, args);
        pause(deadline, 1500, "email login switch");
    }

    std::string username_field = wait_for_element(session, "username", deadline);
    std::string password_field = wait_for_element(session, "password", deadline);

    session.clear(username_field);
    session.send_keys(username_field, account.username);
    session.clear(password_field);
    session.send_keys(password_field, account.password);

    std::optional<std::string> submit_button = session.find_element("css selector", "button[type='submit']");
    if (!submit_button) {
        throw WebDriverError("submit button not found");
    }
    json args = json::array({ json{{API::WEBDRIVER_ELEMENT_KEY, *submit_button}} });
    session.execute_script(Scripts::CLICK_ARGUMENT, args);
    pause(deadline, 2000, "login submission");
}

std::string WebLoginStrategy::wait_for_element(WebDriverSession& session, const std::string& name, const AttemptDeadline& deadline) {
    auto give_up = std::chrono::steady_clock::now() + std::chrono::milliseconds(FIELD_WAIT_MS);
    while (true) {
        std::optional<std::string> element = session.find_element("css selector", "[name='" + name + "']");
        if (element) {
            return *element;
        }
        if (std::chrono::steady_clock::now() >= give_up) {
            throw WebDriverError(name + " input not found");
        }
        pause(deadline, FIELD_POLL_MS, "waiting for " + name + " input");
    }
}

std::string WebLoginStrategy::extract_balance_text(WebDriverSession& session, int wait_seconds, const AttemptDeadline& deadline) {
    auto skeleton_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(SKELETON_WAIT_MS);
    while (std::chrono::steady_clock::now() < skeleton_deadline) {
        json gone = session.execute_script(Scripts::SKELETON_GONE);
        if (gone.is_boolean() && gone.get<bool>()) {
            break;
        }
        pause(deadline, 300, "page render");
    }
    pause(deadline, 1000, "page render");

    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(wait_seconds);
    while (true) {
        json value = session.execute_script(Scripts::EXTRACT_BALANCE);
        std::string text = value.is_string() ? Utils::trim_copy(value.get<std::string>()) : "";
        if (!text.empty()) {
            return text;
        }
        if (std::chrono::steady_clock::now() >= give_up) {
            break;
        }
        pause(deadline, EXTRACT_POLL_MS, "balance extraction");
    }

    json snippet = session.execute_script(Scripts::PAGE_SNIPPET);
    LOG_WARN("Balance not found on page, url=" + session.current_url() +
             " text=" + (snippet.is_string() ? snippet.get<std::string>() : ""));
    throw WebDriverError("no balance text found on the console page");
}

std::string WebLoginStrategy::read_login_error(WebDriverSession& session) {
    try {
        json value = session.execute_script(Scripts::LOGIN_ERROR_TEXT);
        return value.is_string() ? Utils::trim_copy(value.get<std::string>()) : "";
    } catch (const WebDriverError& script_error) {
        LOG_DEBUG(std::string("Could not read login error banner: ") + script_error.what());
        return "";
    }
}

} // namespace WebCheck
} // namespace BalanceMonitor
