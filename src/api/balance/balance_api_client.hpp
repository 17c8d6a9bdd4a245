#ifndef BALANCE_API_CLIENT_HPP
#define BALANCE_API_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>
#include "balance_probe_interface.hpp"
#include "balance_extractors.hpp"
#include "configs/api_config.hpp"

namespace BalanceMonitor {
namespace API {

/**
 * libcurl balance probe against the account's API service.
 * Tries the billing routes first, then walks the compatible routes running
 * each response through the extractor chain.
 */
class BalanceApiClient : public FastBalanceProbe {
public:
    // Throws std::invalid_argument when the base URL is empty.
    explicit BalanceApiClient(const BalanceMonitor::Config::ApiConfig& api_config);

    ProbeResult probe(const std::string& api_key) override;

    std::vector<std::string> build_candidate_paths() const;

private:
    std::string base_url;
    long timeout_ms;
    bool enable_ssl_verification;
    std::vector<std::unique_ptr<BalanceExtractor>> extractors;

    std::vector<std::string> build_auth_headers(const std::string& api_key) const;
    std::optional<double> query_via_billing_routes(const std::vector<std::string>& headers, std::string& error_message) const;
};

} // namespace API
} // namespace BalanceMonitor

#endif // BALANCE_API_CLIENT_HPP
