#include "balance_extractors.hpp"
#include "core/utils/balance_text.hpp"
#include <algorithm>
#include <cmath>

namespace BalanceMonitor {
namespace API {

namespace {
    const std::vector<std::string> USD_HEADER_KEYS = {
        "x-balance", "x-user-balance", "x-credit-balance",
        "x-remaining-balance", "x-total-available", "x-account-balance"
    };
    const std::vector<std::string> QUOTA_HEADER_KEYS = {
        "x-quota", "x-remaining-quota", "x-total-quota"
    };
    const std::vector<std::string> USD_FIELD_PATTERNS = {
        "balance", "remaining_balance", "available_balance", "current_balance",
        "credit_balance", "total_available", "available_credit", "remain_amount"
    };
    const std::vector<std::string> QUOTA_FIELD_PATTERNS = {
        "quota", "remaining_quota", "remain_quota", "left_quota", "available_quota"
    };

    std::string to_lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), ::tolower);
        return text;
    }

    bool matches_any(const std::string& key, const std::vector<std::string>& patterns) {
        for (const auto& pattern : patterns) {
            if (key.find(pattern) != std::string::npos) return true;
        }
        return false;
    }

    std::optional<double> header_number(const HttpResponse& response, const std::string& name) {
        auto it = response.headers.find(name);
        if (it == response.headers.end() || Utils::is_blank(it->second)) {
            return std::nullopt;
        }
        return Utils::parse_first_number(it->second);
    }
}

std::optional<double> json_to_double(const json& value) {
    if (value.is_number()) {
        double number = value.get<double>();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (value.is_string()) {
        return Utils::parse_first_number(value.get<std::string>());
    }
    return std::nullopt;
}

double normalize_balance_value(double value, const std::string& key_hint) {
    if (key_hint.find("quota") != std::string::npos) {
        return value / QUOTA_UNIT_PER_DOLLAR;
    }
    if (std::fabs(value) > 100000.0) {
        return value / QUOTA_UNIT_PER_DOLLAR;
    }
    return value;
}

// ========================================================================
// HEADER EXTRACTION
// ========================================================================

std::optional<double> HeaderBalanceExtractor::extract(const HttpResponse& response) const {
    for (const auto& key : USD_HEADER_KEYS) {
        std::optional<double> value = header_number(response, key);
        if (value) {
            return std::max(0.0, *value);
        }
    }
    for (const auto& key : QUOTA_HEADER_KEYS) {
        std::optional<double> value = header_number(response, key);
        if (value) {
            return std::max(0.0, *value / QUOTA_UNIT_PER_DOLLAR);
        }
    }
    return std::nullopt;
}

// ========================================================================
// BODY EXTRACTION
// ========================================================================

std::optional<double> BodyBalanceExtractor::extract(const HttpResponse& response) const {
    json document = json::parse(response.body, nullptr, false);
    if (document.is_discarded()) {
        return std::nullopt;
    }
    return extract_balance_from_body_json(document);
}

std::optional<double> extract_balance_from_body_json(const json& document) {
    if (document.is_object()) {
        if (document.contains("total_available")) {
            std::optional<double> value = json_to_double(document["total_available"]);
            if (value) return std::max(0.0, *value);
        }
        if (document.contains("balance")) {
            std::optional<double> value = json_to_double(document["balance"]);
            if (value) return std::max(0.0, normalize_balance_value(*value, "balance"));
        }
    }
    std::optional<double> scanned = scan_balance_value(document, 0);
    if (scanned) {
        return std::max(0.0, *scanned);
    }
    return std::nullopt;
}

std::optional<double> scan_balance_value(const json& node, int depth) {
    if (depth > BODY_SCAN_MAX_DEPTH) {
        return std::nullopt;
    }

    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = to_lower(it.key());
            if (matches_any(key, USD_FIELD_PATTERNS)) {
                std::optional<double> value = json_to_double(it.value());
                if (value) return normalize_balance_value(*value, key);
            }
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = to_lower(it.key());
            if (matches_any(key, QUOTA_FIELD_PATTERNS)) {
                std::optional<double> value = json_to_double(it.value());
                if (value) return *value / QUOTA_UNIT_PER_DOLLAR;
            }
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::optional<double> found = scan_balance_value(it.value(), depth + 1);
            if (found) return found;
        }
        return std::nullopt;
    }

    if (node.is_array()) {
        for (const auto& item : node) {
            std::optional<double> found = scan_balance_value(item, depth + 1);
            if (found) return found;
        }
    }
    return std::nullopt;
}

std::vector<std::unique_ptr<BalanceExtractor>> build_default_extractors() {
    std::vector<std::unique_ptr<BalanceExtractor>> extractors;
    extractors.push_back(std::make_unique<HeaderBalanceExtractor>());
    extractors.push_back(std::make_unique<BodyBalanceExtractor>());
    return extractors;
}

// ========================================================================
// BILLING ROUTES
// ========================================================================

std::optional<double> compute_billing_remaining(const json& subscription, const json& usage, std::string& error_message) {
    std::optional<double> hard_limit;
    if (subscription.is_object()) {
        if (subscription.contains("hard_limit_usd")) {
            hard_limit = json_to_double(subscription["hard_limit_usd"]);
        }
        if (!hard_limit && subscription.contains("soft_limit_usd")) {
            hard_limit = json_to_double(subscription["soft_limit_usd"]);
        }
    }
    if (!hard_limit) {
        error_message = "subscription has no hard_limit_usd/soft_limit_usd";
        return std::nullopt;
    }

    std::optional<double> total_usage;
    if (usage.is_object() && usage.contains("total_usage")) {
        total_usage = json_to_double(usage["total_usage"]);
    }
    if (!total_usage) {
        error_message = "usage has no total_usage";
        return std::nullopt;
    }

    double usage_usd = *total_usage;
    if (*hard_limit > 0.0 && *total_usage > *hard_limit * 2.0) {
        usage_usd = *total_usage / 100.0;
    }
    return std::max(0.0, *hard_limit - usage_usd);
}

} // namespace API
} // namespace BalanceMonitor
