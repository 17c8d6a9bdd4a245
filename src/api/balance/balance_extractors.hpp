#ifndef BALANCE_EXTRACTORS_HPP
#define BALANCE_EXTRACTORS_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/utils/http_utils.hpp"

namespace BalanceMonitor {
namespace API {

using json = nlohmann::json;

constexpr double QUOTA_UNIT_PER_DOLLAR = 500000.0;
constexpr int BODY_SCAN_MAX_DEPTH = 5;

/**
 * One strategy for pulling a dollar balance out of an HTTP response.
 * Extractors are tried in priority order; the first value wins.
 */
class BalanceExtractor {
public:
    virtual ~BalanceExtractor() = default;
    virtual std::string get_source_prefix() const = 0;
    virtual std::optional<double> extract(const HttpResponse& response) const = 0;
};

// x-balance style headers in dollars, x-quota style headers in quota units.
class HeaderBalanceExtractor : public BalanceExtractor {
public:
    std::string get_source_prefix() const override { return "header"; }
    std::optional<double> extract(const HttpResponse& response) const override;
};

// total_available, then balance, then a bounded recursive scan of the JSON body.
class BodyBalanceExtractor : public BalanceExtractor {
public:
    std::string get_source_prefix() const override { return "body"; }
    std::optional<double> extract(const HttpResponse& response) const override;
};

std::vector<std::unique_ptr<BalanceExtractor>> build_default_extractors();

// Numbers and numeric strings; anything else is empty.
std::optional<double> json_to_double(const json& value);

// Quota keys and implausibly large values are quota units.
double normalize_balance_value(double value, const std::string& key_hint);

std::optional<double> extract_balance_from_body_json(const json& document);
std::optional<double> scan_balance_value(const json& node, int depth);

// Remaining dollars from the subscription and usage billing documents.
// Usage reported in cents (more than twice the limit) is scaled down.
std::optional<double> compute_billing_remaining(const json& subscription, const json& usage, std::string& error_message);

} // namespace API
} // namespace BalanceMonitor

#endif // BALANCE_EXTRACTORS_HPP
