#include <gtest/gtest.h>
#include "types.hpp"
#include "errors.hpp"
#include "stores.hpp"
#include "test_fixtures.hpp"

using json = nlohmann::json;

TEST(AssessmentRequestJsonTest, ParsesFullRequest) {
    json j = {
        {"customer_id", "cust-1"},
        {"transaction_history", json::array({
            {{"id", "h1"}, {"amount", 120.5}, {"currency", "EUR"},
             {"timestamp", "2024-02-28T09:30:00Z"}, {"category", "travel"}}
        })},
        {"external_risk_factors", {
            {"credit_score", 710}, {"watchlist_matches", 1},
            {"sanctions_check", "CLEAR"}, {"identity_verification_status", "PENDING"}
        }},
        {"market_data", {{"market_volatility", 18.2}, {"source", "feed-a"}}},
        {"request_timestamp", "2024-03-01T12:00:00.250Z"},
        {"explainability_config", {{"depth", 5}, {"regulator_facing", true}}},
        {"transaction", {
            {"transaction_id", "t-1"}, {"amount", 99.99}, {"currency", "EUR"},
            {"ip_address", ""}, {"device_fingerprint", "fp"}
        }},
        {"correlation_id", "corr-1"}
    };

    auto request = AssessmentRequest::from_json(j);

    EXPECT_EQ(request.customer_id, "cust-1");
    ASSERT_EQ(request.transaction_history.size(), 1u);
    EXPECT_EQ(request.transaction_history[0].id, "h1");
    EXPECT_DOUBLE_EQ(request.transaction_history[0].amount, 120.5);
    EXPECT_EQ(request.transaction_history[0].timestamp, util::parse_iso8601("2024-02-28T09:30:00Z"));

    EXPECT_EQ(request.external_risk_factors.credit_score, 710.0);
    EXPECT_EQ(request.external_risk_factors.watchlist_matches, 1);
    EXPECT_FALSE(request.external_risk_factors.device_risk_score.has_value());

    ASSERT_EQ(request.market_data.size(), 1u);
    EXPECT_DOUBLE_EQ(request.market_data.at("market_volatility"), 18.2);

    EXPECT_EQ(request.request_timestamp,
              fixtures::base_time() + std::chrono::milliseconds(250));
    EXPECT_EQ(request.explainability.depth, 5);
    EXPECT_FALSE(request.explainability.customer_facing);
    EXPECT_TRUE(request.explainability.regulator_facing);

    ASSERT_TRUE(request.transaction.has_value());
    EXPECT_EQ(request.transaction->customer_id, "cust-1");
    EXPECT_EQ(request.transaction->amount, 99.99);
    EXPECT_FALSE(request.transaction->ip_address.has_value());
    EXPECT_EQ(request.transaction->device_fingerprint, std::string("fp"));
    EXPECT_EQ(request.correlation_id, "corr-1");
}

TEST(AssessmentRequestJsonTest, MinimalRequestUsesDefaults) {
    auto request = AssessmentRequest::from_json({{"customer_id", "c"}});
    EXPECT_TRUE(request.transaction_history.empty());
    EXPECT_TRUE(request.external_risk_factors.empty());
    EXPECT_TRUE(request.market_data.empty());
    EXPECT_EQ(request.explainability.depth, 3);
    EXPECT_FALSE(request.transaction.has_value());
    EXPECT_NE(request.request_timestamp, TimePoint{});
}

TEST(AssessmentRequestJsonTest, RejectsMalformedInput) {
    try {
        AssessmentRequest::from_json({{"transaction_history", json::array()}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "customer_id");
    }

    EXPECT_THROW(AssessmentRequest::from_json(json::array()), ValidationError);
    EXPECT_THROW(AssessmentRequest::from_json({{"customer_id", "c"}, {"transaction_history", "nope"}}),
                 ValidationError);
    EXPECT_THROW(AssessmentRequest::from_json({{"customer_id", "c"},
                                               {"transaction_history", json::array({{{"id", "x"}}})}}),
                 ValidationError);
    EXPECT_THROW(AssessmentRequest::from_json({{"customer_id", "c"}, {"request_timestamp", "yesterday"}}),
                 ValidationError);
    EXPECT_THROW(AssessmentRequest::from_json({{"customer_id", "c"},
                                               {"external_risk_factors", {{"credit_score", "high"}}}}),
                 ValidationError);
}

TEST(FraudScoringRequestJsonTest, AmountIsOptionalWhenParsing) {
    auto request = FraudScoringRequest::from_json({{"transaction_id", "t"}, {"customer_id", "c"}});
    EXPECT_FALSE(request.amount.has_value());
    EXPECT_TRUE(request.external_risk.empty());

    auto j = request.to_json();
    EXPECT_TRUE(j.at("amount").is_null());
    EXPECT_TRUE(j.at("ip_address").is_null());
}

TEST(AssessmentResponseJsonTest, SerialisesOptionalFraudFieldsAsNull) {
    AssessmentResponse response;
    response.assessment_id = "a-1";
    response.customer_id = "c";
    response.risk_score = 315;
    response.risk_category = RiskCategory::MEDIUM;
    response.confidence_interval = 35;
    response.fallback_applied = true;
    response.assessment_timestamp = fixtures::base_time();

    RiskFactor factor;
    factor.name = "CREDIT_PROFILE";
    factor.score = 0.25;
    factor.weight = 0.15;
    response.risk_factors.push_back(factor);

    auto j = response.to_json();
    EXPECT_EQ(j.at("risk_category"), "MEDIUM");
    EXPECT_EQ(j.at("assessment_timestamp"), "2024-03-01T12:00:00.000Z");
    EXPECT_TRUE(j.at("fraud_score").is_null());
    EXPECT_TRUE(j.at("fraud_recommendation").is_null());
    EXPECT_EQ(j.at("fallback_applied"), true);
    EXPECT_EQ(j.at("risk_factors")[0].at("name"), "CREDIT_PROFILE");

    response.fraud_score = 672;
    response.fraud_recommendation = Recommendation::CHALLENGE;
    j = response.to_json();
    EXPECT_EQ(j.at("fraud_score"), 672);
    EXPECT_EQ(j.at("fraud_recommendation"), "CHALLENGE");
}

TEST(CommandEnvelopeJsonTest, RequestDefaultsAndReplyShape) {
    auto request = CommandRequest::from_json({{"corr_id", "c-1"}});
    EXPECT_EQ(request.cmd, "assess");
    EXPECT_EQ(request.corr_id, "c-1");
    EXPECT_TRUE(request.payload.is_object());

    CommandReply ok;
    ok.corr_id = "c-1";
    ok.ok = true;
    ok.data = {{"x", 1}};
    auto j = ok.to_json();
    EXPECT_FALSE(j.contains("error_type"));
    EXPECT_EQ(j.at("data").at("x"), 1);

    CommandReply failed;
    failed.ok = false;
    failed.error_type = "validation_error";
    failed.message = "bad";
    j = failed.to_json();
    EXPECT_EQ(j.at("error_type"), "validation_error");
    EXPECT_EQ(j.at("message"), "bad");
}

TEST(WindowEntryJsonTest, PreservesMillisecondTimestamps) {
    WindowEntry entry{"t-1", 42.5, fixtures::base_time() + std::chrono::milliseconds(123)};
    auto parsed = WindowEntry::from_json(entry.to_json());
    EXPECT_EQ(parsed.transaction_id, "t-1");
    EXPECT_DOUBLE_EQ(parsed.amount, 42.5);
    EXPECT_EQ(parsed.timestamp, entry.timestamp);
}

TEST(EnumStringsTest, RoundTripNames) {
    EXPECT_EQ(to_string(RiskCategory::CRITICAL), "CRITICAL");
    EXPECT_EQ(risk_category_from_string("HIGH"), RiskCategory::HIGH);
    EXPECT_EQ(risk_category_from_string("bogus"), RiskCategory::UNKNOWN);
    EXPECT_EQ(alert_status_from_string("CONFIRMED"), AlertStatus::CONFIRMED);
    EXPECT_EQ(to_string(Recommendation::BLOCK), "BLOCK");
    EXPECT_EQ(to_string(PriorityLevel::HIGH), "HIGH");
}
