#include <gtest/gtest.h>
#include "risk_factor_analyzer.hpp"
#include "errors.hpp"
#include "test_fixtures.hpp"
#include <algorithm>

class RiskFactorAnalyzerTest : public ::testing::Test {
protected:
    RiskFactorAnalyzer analyzer;
};

TEST_F(RiskFactorAnalyzerTest, ProducesTheFixedFactorSetInOrder) {
    auto request = fixtures::assessment();
    auto factors = analyzer.analyze(request, "profile-1");

    std::vector<std::string> names;
    for (const auto& factor : factors) {
        names.push_back(factor.name);
        EXPECT_EQ(factor.profile_id, "profile-1");
        EXPECT_EQ(factor.calculated_at, request.request_timestamp);
        EXPECT_GE(factor.score, 0.0);
        EXPECT_LE(factor.score, 1.0);
    }
    EXPECT_EQ(names, (std::vector<std::string>{
        "INSUFFICIENT_HISTORY", "CREDIT_PROFILE", "WATCHLIST_SCREENING", "SANCTIONS_STATUS",
        "DEVICE_RISK", "IDENTITY_VERIFICATION", "MARKET_CONDITIONS"}));

    double weights = 0.0;
    for (const auto& factor : factors) {
        weights += factor.weight;
    }
    EXPECT_NEAR(weights, 1.0, 1e-12);
}

TEST_F(RiskFactorAnalyzerTest, MissingInputsGetNeutralScoresAndSayWhy) {
    auto factors = analyzer.analyze(fixtures::assessment(), "p");

    EXPECT_DOUBLE_EQ(factors[0].score, RiskFactorAnalyzer::kInsufficientHistoryScore);
    EXPECT_EQ(factors[0].description, "No transaction history available, elevated baseline risk applied");
    EXPECT_EQ(factors[0].data_source, "transaction_history");

    for (size_t i = 1; i < factors.size(); ++i) {
        EXPECT_DOUBLE_EQ(factors[i].score, 0.5) << factors[i].name;
        EXPECT_NE(factors[i].description.find("not provided, neutral score applied"), std::string::npos)
            << factors[i].name;
    }

    EXPECT_NEAR(factor_score(factors), 485.0, 1e-9);
}

TEST_F(RiskFactorAnalyzerTest, ExternalSignalsDriveTheirFactors) {
    auto request = fixtures::assessment();
    request.external_risk_factors = fixtures::high_risk_customer();
    auto factors = analyzer.analyze(request, "p");

    EXPECT_NEAR(factors[1].score, 330.0 / 350.0, 1e-12);
    EXPECT_EQ(factors[1].data_source, "credit_bureau");
    EXPECT_DOUBLE_EQ(factors[2].score, 1.0);
    EXPECT_EQ(factors[2].description, "2 watchlist match(es)");
    EXPECT_DOUBLE_EQ(factors[3].score, 0.0);
    EXPECT_DOUBLE_EQ(factors[4].score, 0.85);
    EXPECT_DOUBLE_EQ(factors[5].score, 1.0);
    EXPECT_EQ(factors[5].description, "Identity verification status FAILED");

    EXPECT_NEAR(factor_score(factors), 636.428571, 1e-5);
}

TEST_F(RiskFactorAnalyzerTest, HistoryReplacesTheInsufficientHistoryFactor) {
    auto request = fixtures::assessment();
    auto t = fixtures::base_time();
    request.transaction_history = {
        fixtures::history_record("a", 0.0, t, "retail"),
        fixtures::history_record("b", 20000.0, t, "travel"),
    };

    auto spending = analyzer.analyze(request, "p").front();
    EXPECT_EQ(spending.name, "SPENDING_PATTERNS");
    EXPECT_NEAR(spending.score, 0.69, 1e-12);
    EXPECT_DOUBLE_EQ(spending.weight, RiskFactorAnalyzer::kSpendingWeight);
    EXPECT_NE(spending.description.find("2 transactions"), std::string::npos);
}

TEST_F(RiskFactorAnalyzerTest, MarketDataIsScored) {
    auto request = fixtures::assessment();
    request.market_data = {{"market_volatility", 20.0}, {"interest_rates", 3.0}};
    auto market = analyzer.analyze(request, "p").back();
    EXPECT_EQ(market.name, "MARKET_CONDITIONS");
    EXPECT_NEAR(market.score, 0.1, 1e-12);
    EXPECT_EQ(market.data_source, "market_data");
}

TEST_F(RiskFactorAnalyzerTest, RejectsEmptyCustomerId) {
    auto request = fixtures::assessment("");
    EXPECT_THROW(analyzer.analyze(request, "p"), ValidationError);
}

TEST(FactorScoreTest, EmptyFactorSetScoresZero) {
    EXPECT_DOUBLE_EQ(factor_score({}), 0.0);
}
