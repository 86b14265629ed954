#include <gtest/gtest.h>
#include "http_scoring_backend.hpp"

TEST(HttpScoringBackendTest, ScalesModelProbabilityToScore) {
    auto result = HttpScoringBackend::parse_response(
        200, R"({"transaction_id":"t-1","fraud_score":0.42,"is_fraud":false,"reason":"velocity within norms"})");

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.base_score, 420.0);
    ASSERT_EQ(result.reasons.size(), 1u);
    EXPECT_EQ(result.reasons[0], "velocity within norms");
}

TEST(HttpScoringBackendTest, FraudFlagAddsReason) {
    auto result = HttpScoringBackend::parse_response(200, R"({"fraud_score":0.91,"is_fraud":true})");
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.base_score, 910.0);
    ASSERT_EQ(result.reasons.size(), 1u);
    EXPECT_EQ(result.reasons[0], "Fraud model classified the transaction as fraudulent");
}

TEST(HttpScoringBackendTest, ServerErrorsAreUnavailable) {
    EXPECT_EQ(HttpScoringBackend::parse_response(503, "").status, ScoringResult::Status::Unavailable);
    EXPECT_EQ(HttpScoringBackend::parse_response(0, "").status, ScoringResult::Status::Unavailable);
}

TEST(HttpScoringBackendTest, ClientErrorsAndBadBodiesAreFatal) {
    EXPECT_EQ(HttpScoringBackend::parse_response(422, "{}").status, ScoringResult::Status::Fatal);
    EXPECT_EQ(HttpScoringBackend::parse_response(200, "not json").status, ScoringResult::Status::Fatal);
    EXPECT_EQ(HttpScoringBackend::parse_response(200, R"({"is_fraud":true})").status,
              ScoringResult::Status::Fatal);
    EXPECT_EQ(HttpScoringBackend::parse_response(200, R"({"fraud_score":1.7})").status,
              ScoringResult::Status::Fatal);
    EXPECT_EQ(HttpScoringBackend::parse_response(200, R"({"fraud_score":"0.3"})").status,
              ScoringResult::Status::Fatal);
}
