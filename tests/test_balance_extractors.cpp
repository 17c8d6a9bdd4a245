#include <gtest/gtest.h>
#include "api/balance/balance_api_client.hpp"
#include "api/balance/balance_extractors.hpp"

using namespace BalanceMonitor::API;

namespace {

HttpResponse response_with_body(const std::string& body) {
    HttpResponse response;
    response.transport_ok = true;
    response.status_code = 200;
    response.body = body;
    return response;
}

} // namespace

TEST(HeaderBalanceExtractorTest, PrefersDollarHeadersOverQuota) {
    HttpResponse response = response_with_body("");
    response.headers["x-quota"] = "1000000";
    response.headers["x-user-balance"] = "$12.75";

    HeaderBalanceExtractor extractor;
    EXPECT_DOUBLE_EQ(extractor.extract(response).value(), 12.75);
}

TEST(HeaderBalanceExtractorTest, ConvertsQuotaUnits) {
    HttpResponse response = response_with_body("");
    response.headers["x-remaining-quota"] = "2500000";

    HeaderBalanceExtractor extractor;
    EXPECT_DOUBLE_EQ(extractor.extract(response).value(), 5.0);
}

TEST(HeaderBalanceExtractorTest, NoHeadersMeansNoValue) {
    HeaderBalanceExtractor extractor;
    EXPECT_FALSE(extractor.extract(response_with_body("{}")).has_value());
}

TEST(BodyBalanceExtractorTest, ReadsTopLevelFields) {
    BodyBalanceExtractor extractor;
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"total_available": 8.5, "balance": 1})")).value(), 8.5);
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"balance": "3.20"})")).value(), 3.2);
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"balance": 5000000})")).value(), 10.0);
}

TEST(BodyBalanceExtractorTest, ScansNestedDocuments) {
    BodyBalanceExtractor extractor;
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"data": {"user": {"remain_quota": 1500000}}})")).value(), 3.0);
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"data": [{"name": "x"}, {"available_balance": 4.25}]})")).value(), 4.25);
}

TEST(BodyBalanceExtractorTest, IgnoresInvalidOrTooDeepBodies) {
    BodyBalanceExtractor extractor;
    EXPECT_FALSE(extractor.extract(response_with_body("<html>nope</html>")).has_value());
    EXPECT_FALSE(extractor.extract(response_with_body(R"({"a":{"b":{"c":{"d":{"e":{"f":{"g":{"balance":1}}}}}}}})")).has_value());
}

TEST(BodyBalanceExtractorTest, NegativeBalancesClampToZero) {
    BodyBalanceExtractor extractor;
    EXPECT_DOUBLE_EQ(extractor.extract(response_with_body(R"({"balance": -2})")).value(), 0.0);
}

TEST(BalanceExtractorChainTest, HeaderExtractorRunsFirst) {
    auto extractors = build_default_extractors();
    ASSERT_EQ(extractors.size(), 2u);
    EXPECT_EQ(extractors[0]->get_source_prefix(), "header");
    EXPECT_EQ(extractors[1]->get_source_prefix(), "body");
}

TEST(BillingRemainingTest, SubtractsUsageFromLimit) {
    std::string error;
    auto remaining = compute_billing_remaining(json{{"hard_limit_usd", 100.0}}, json{{"total_usage", 25.5}}, error);
    ASSERT_TRUE(remaining.has_value());
    EXPECT_DOUBLE_EQ(*remaining, 74.5);
}

TEST(BillingRemainingTest, ScalesUsageReportedInCents) {
    std::string error;
    auto remaining = compute_billing_remaining(json{{"soft_limit_usd", 50.0}}, json{{"total_usage", 2000}}, error);
    ASSERT_TRUE(remaining.has_value());
    EXPECT_DOUBLE_EQ(*remaining, 30.0);
}

TEST(BillingRemainingTest, ReportsMissingFields) {
    std::string error;
    EXPECT_FALSE(compute_billing_remaining(json::object(), json{{"total_usage", 1}}, error).has_value());
    EXPECT_NE(error.find("hard_limit_usd"), std::string::npos);
    EXPECT_FALSE(compute_billing_remaining(json{{"hard_limit_usd", 1}}, json::object(), error).has_value());
    EXPECT_NE(error.find("total_usage"), std::string::npos);
}

TEST(BalanceApiClientTest, RejectsEmptyBaseUrlAndMissingKey) {
    BalanceMonitor::Config::ApiConfig config;
    config.base_url = "";
    EXPECT_THROW(BalanceApiClient client(config), std::invalid_argument);

    config.base_url = "http://127.0.0.1:1";
    BalanceApiClient client(config);
    ProbeResult result = client.probe("   ");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "missing API key");
    EXPECT_FALSE(client.build_candidate_paths().empty());
}
