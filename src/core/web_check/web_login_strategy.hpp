#ifndef WEB_LOGIN_STRATEGY_HPP
#define WEB_LOGIN_STRATEGY_HPP

#include <string>
#include "slow_balance_strategy.hpp"

namespace BalanceMonitor {
namespace API {
class WebDriverSession;
}

namespace WebCheck {

// Console login through a WebDriver session on the leased worker, then balance extraction.
class WebLoginStrategy : public SlowBalanceStrategy {
public:
    explicit WebLoginStrategy(const std::string& console_page_url) : console_url(console_page_url) {}

    WebCheckResult run_once(const Core::Account& account,
                            const std::string& worker_endpoint,
                            const BalanceMonitor::Config::BrowserConfig& browser_config,
                            const Utils::AttemptDeadline& deadline) override;

private:
    std::string console_url;

    void submit_login_form(API::WebDriverSession& session, const Core::Account& account, const Utils::AttemptDeadline& deadline);
    std::string wait_for_element(API::WebDriverSession& session, const std::string& name, const Utils::AttemptDeadline& deadline);
    std::string extract_balance_text(API::WebDriverSession& session, int wait_seconds, const Utils::AttemptDeadline& deadline);
    std::string read_login_error(API::WebDriverSession& session);
};

} // namespace WebCheck
} // namespace BalanceMonitor

#endif // WEB_LOGIN_STRATEGY_HPP
