#include <gtest/gtest.h>
#include "risk_math.hpp"
#include "test_fixtures.hpp"

using namespace risk_math;

TEST(RiskMathTest, MissingExternalSignalsAreNeutral) {
    EXPECT_DOUBLE_EQ(credit_risk(std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(watchlist_risk(std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(sanctions_risk(std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(device_risk(std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(identity_risk(std::nullopt), 0.5);
    EXPECT_DOUBLE_EQ(external_composite(ExternalRiskFactors{}), 0.5);
}

TEST(RiskMathTest, CreditRiskScale) {
    EXPECT_DOUBLE_EQ(credit_risk(850.0), 0.0);
    EXPECT_DOUBLE_EQ(credit_risk(900.0), 0.0);
    EXPECT_DOUBLE_EQ(credit_risk(500.0), 1.0);
    EXPECT_DOUBLE_EQ(credit_risk(300.0), 1.0);
    EXPECT_NEAR(credit_risk(800.0), 50.0 / 350.0, 1e-12);
}

TEST(RiskMathTest, ScreeningStatuses) {
    EXPECT_DOUBLE_EQ(watchlist_risk(0), 0.0);
    EXPECT_DOUBLE_EQ(watchlist_risk(1), 0.5);
    EXPECT_DOUBLE_EQ(watchlist_risk(4), 1.0);
    EXPECT_DOUBLE_EQ(watchlist_risk(-2), 0.0);

    EXPECT_DOUBLE_EQ(sanctions_risk(std::string("clear")), 0.0);
    EXPECT_DOUBLE_EQ(sanctions_risk(std::string(" PENDING ")), 0.6);
    EXPECT_DOUBLE_EQ(sanctions_risk(std::string("HIT")), 1.0);
    EXPECT_DOUBLE_EQ(sanctions_risk(std::string("something-else")), 0.5);

    EXPECT_DOUBLE_EQ(identity_risk(std::string("VERIFIED")), 0.0);
    EXPECT_DOUBLE_EQ(identity_risk(std::string("rejected")), 1.0);
}

TEST(RiskMathTest, DeviceRiskAcceptsPercentScale) {
    EXPECT_DOUBLE_EQ(device_risk(0.3), 0.3);
    EXPECT_NEAR(device_risk(85.0), 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(device_risk(250.0), 1.0);
}

TEST(RiskMathTest, ExternalCompositeOfReferenceCustomers) {
    EXPECT_NEAR(external_composite(fixtures::low_risk_customer()), 0.0432142857, 1e-9);
    EXPECT_NEAR(external_composite(fixtures::high_risk_customer()), 0.7632142857, 1e-9);
    EXPECT_NEAR(external_composite(fixtures::sanctioned_customer()), 0.9925, 1e-9);
}

TEST(RiskMathTest, MarketRisk) {
    EXPECT_DOUBLE_EQ(market_risk({}), 0.5);
    EXPECT_NEAR(market_risk({{"market_volatility", 20.0}, {"interest_rates", 3.0}}), 0.1, 1e-12);
    EXPECT_NEAR(market_risk({{"market_volatility", 40.0}}), 0.45, 1e-12);
    EXPECT_DOUBLE_EQ(market_risk({{"market_volatility", 400.0}, {"interest_rates", 20.0}}), 1.0);
}

TEST(RiskMathTest, SpendingStatsOfUniformHistory) {
    auto t = fixtures::base_time();
    std::vector<TransactionRecord> history = {
        fixtures::history_record("a", 100.0, t),
        fixtures::history_record("b", 100.0, t),
    };
    auto stats = spending_stats(history);
    EXPECT_DOUBLE_EQ(stats.high_value_ratio, 0.0);
    EXPECT_DOUBLE_EQ(stats.variability, 0.0);
    EXPECT_DOUBLE_EQ(stats.diversity, 0.0);
    EXPECT_DOUBLE_EQ(stats.average_amount, 100.0);
    EXPECT_NEAR(stats.score, 0.2 * 100.0 / 50000.0, 1e-12);
}

TEST(RiskMathTest, SpendingStatsOfMixedHistory) {
    auto t = fixtures::base_time();
    std::vector<TransactionRecord> history = {
        fixtures::history_record("a", 0.0, t, "retail"),
        fixtures::history_record("b", 20000.0, t, "travel"),
    };
    auto stats = spending_stats(history);
    EXPECT_DOUBLE_EQ(stats.high_value_ratio, 0.5);
    EXPECT_DOUBLE_EQ(stats.variability, 1.0);
    EXPECT_NEAR(stats.diversity, 1.0, 1e-12);
    EXPECT_NEAR(stats.score, 0.15 + 0.3 + 0.2 + 0.2 * 0.2, 1e-12);

    EXPECT_DOUBLE_EQ(spending_stats({}).score, 0.0);
}

TEST(RiskMathTest, CategoryEntropyTreatsBlankAsOneCategory) {
    auto t = fixtures::base_time();
    std::vector<TransactionRecord> history = {
        fixtures::history_record("a", 10.0, t, ""),
        fixtures::history_record("b", 10.0, t, ""),
    };
    EXPECT_DOUBLE_EQ(category_entropy(history), 0.0);
}

TEST(RiskMathTest, FraudPoints) {
    EXPECT_DOUBLE_EQ(amount_points(0.0), 0.0);
    EXPECT_DOUBLE_EQ(amount_points(5.0), 0.0);
    EXPECT_NEAR(amount_points(100.0), 125.0, 1e-9);
    EXPECT_NEAR(amount_points(1000.0), 245.0, 1e-9);
    EXPECT_DOUBLE_EQ(amount_points(1e7), 400.0);

    EXPECT_DOUBLE_EQ(surge_points(1.0), 0.0);
    EXPECT_NEAR(surge_points(4.0), 240.0, 1e-9);
    EXPECT_DOUBLE_EQ(surge_points(100.0), 250.0);

    EXPECT_DOUBLE_EQ(streak_points(0), 0.0);
    EXPECT_DOUBLE_EQ(streak_points(2), 200.0);
    EXPECT_DOUBLE_EQ(streak_points(9), 300.0);

    EXPECT_DOUBLE_EQ(frequency_points(4, 5), 0.0);
    EXPECT_DOUBLE_EQ(frequency_points(5, 5), 50.0);
    EXPECT_DOUBLE_EQ(frequency_points(20, 5), 200.0);
}

TEST(RiskMathTest, FraudConfidenceIsHighestAtTheExtremes) {
    EXPECT_DOUBLE_EQ(fraud_confidence(50), 0.95);
    EXPECT_DOUBLE_EQ(fraud_confidence(144), 0.85);
    EXPECT_DOUBLE_EQ(fraud_confidence(400), 0.70);
    EXPECT_DOUBLE_EQ(fraud_confidence(672), 0.85);
    EXPECT_DOUBLE_EQ(fraud_confidence(824), 0.95);
}

TEST(RiskMathTest, WeightedMean) {
    EXPECT_DOUBLE_EQ(weighted_mean({}), 0.0);
    EXPECT_DOUBLE_EQ(weighted_mean({{1.0, 0.0}}), 0.0);
    EXPECT_DOUBLE_EQ(weighted_mean({{1.0, 1.0}, {0.0, 3.0}}), 0.25);
}
