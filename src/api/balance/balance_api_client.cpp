#include "balance_api_client.hpp"
#include "core/logging/logging_macros.hpp"
#include "core/utils/balance_text.hpp"
#include "core/utils/time_utils.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

namespace BalanceMonitor {
namespace API {

BalanceApiClient::BalanceApiClient(const BalanceMonitor::Config::ApiConfig& api_config)
    : base_url(Utils::trim_copy(api_config.base_url)),
      timeout_ms(static_cast<long>(std::max(1, api_config.timeout_seconds)) * 1000L),
      enable_ssl_verification(api_config.enable_ssl_verification),
      extractors(build_default_extractors()) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    if (base_url.empty()) {
        throw std::invalid_argument("api.base_url is empty, cannot build the balance API client");
    }
}

std::vector<std::string> BalanceApiClient::build_auth_headers(const std::string& api_key) const {
    return {
        "Authorization: Bearer " + api_key,
        "Accept: application/json"
    };
}

std::vector<std::string> BalanceApiClient::build_candidate_paths() const {
    std::tm today_tm = TimeUtils::to_local_tm(std::chrono::system_clock::now());
    std::string today = TimeUtils::format_date(today_tm);
    std::string month_start = TimeUtils::format_month_start(today_tm);
    return {
        "/v1/dashboard/billing/usage?start_date=" + month_start + "&end_date=" + today,
        "/v1/dashboard/billing/subscription",
        "/v1/dashboard/billing/credit_grants",
        "/dashboard/billing/credit_grants",
        "/api/user/balance",
        "/api/user/self",
        "/api/user/info",
        "/api/token/self",
        "/api/token/info",
        "/v1/models"
    };
}

ProbeResult BalanceApiClient::probe(const std::string& api_key) {
    std::string key = Utils::trim_copy(api_key);
    if (key.empty()) {
        return ProbeResult::fail("missing API key");
    }
    std::vector<std::string> headers = build_auth_headers(key);

    std::string billing_error;
    std::optional<double> billing_balance = query_via_billing_routes(headers, billing_error);
    if (billing_balance) {
        return ProbeResult::ok(*billing_balance, "billing:subscription+usage", "balance computed from billing routes");
    }
    LOG_DEBUG("Billing routes failed, trying compatible routes: " + billing_error);

    std::string last_error = "no balance endpoint matched";
    for (const auto& path : build_candidate_paths()) {
        HttpResponse response = http_get(join_url(base_url, path), headers, timeout_ms, enable_ssl_verification);
        if (!response.transport_ok) {
            last_error = "request failed (" + path + "): " + response.error_message;
            LOG_DEBUG(last_error);
            continue;
        }
        if (response.status_code >= 400) {
            last_error = "HTTP " + std::to_string(response.status_code) + " (" + path + ")";
            LOG_DEBUG(last_error);
            continue;
        }

        for (const auto& extractor : extractors) {
            std::optional<double> value = extractor->extract(response);
            if (value) {
                return ProbeResult::ok(std::max(0.0, *value), extractor->get_source_prefix() + ":" + path,
                                       "balance read from response " + extractor->get_source_prefix());
            }
        }
        last_error = "no parsable balance field (" + path + ")";
    }

    return ProbeResult::fail(last_error);
}

std::optional<double> BalanceApiClient::query_via_billing_routes(const std::vector<std::string>& headers, std::string& error_message) const {
    std::tm today_tm = TimeUtils::to_local_tm(std::chrono::system_clock::now());
    std::string subscription_url = join_url(base_url, "/v1/dashboard/billing/subscription");
    std::string usage_url = join_url(base_url, "/v1/dashboard/billing/usage?start_date=" +
                                     TimeUtils::format_month_start(today_tm) + "&end_date=" + TimeUtils::format_date(today_tm));

    auto subscription_future = std::async(std::launch::async, [&]() {
        return http_get(subscription_url, headers, timeout_ms, enable_ssl_verification);
    });
    HttpResponse usage_response = http_get(usage_url, headers, timeout_ms, enable_ssl_verification);
    HttpResponse subscription_response = subscription_future.get();

    if (!subscription_response.transport_ok || !usage_response.transport_ok) {
        error_message = "billing route request failed: " +
                        (subscription_response.transport_ok ? usage_response.error_message : subscription_response.error_message);
        return std::nullopt;
    }
    if (subscription_response.status_code >= 400 || usage_response.status_code >= 400) {
        error_message = "billing route HTTP error: subscription=" + std::to_string(subscription_response.status_code) +
                        ", usage=" + std::to_string(usage_response.status_code);
        return std::nullopt;
    }

    json subscription = json::parse(subscription_response.body, nullptr, false);
    json usage = json::parse(usage_response.body, nullptr, false);
    if (subscription.is_discarded() || usage.is_discarded()) {
        error_message = "billing route returned invalid JSON";
        return std::nullopt;
    }

    return compute_billing_remaining(subscription, usage, error_message);
}

} // namespace API
} // namespace BalanceMonitor
