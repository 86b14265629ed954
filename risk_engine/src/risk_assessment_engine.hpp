#pragma once

#include "config.hpp"
#include "customer_locks.hpp"
#include "event_publisher.hpp"
#include "fraud_scorer.hpp"
#include "risk_factor_analyzer.hpp"
#include "scoring_backend.hpp"
#include "stores.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

class RiskAssessmentEngine {
public:
    static constexpr int kEventVersion = 1;
    static constexpr double kFallbackFraudConfidence = 0.5;

    RiskAssessmentEngine(const Config& config,
                         RiskRepository& repository,
                         FraudScoringBackend& backend,
                         TransactionWindowStore& window,
                         EventPublisher& publisher);

    // Full assessment of one customer. ValidationError propagates as is; store
    // and fatal scoring failures roll back and surface as RiskAssessmentException.
    AssessmentResponse assess(const AssessmentRequest& request);

    // Standalone fraud scoring of a single transaction in its own unit of work.
    // An unavailable backend yields the conservative fallback result.
    FraudScoreResult score_transaction(const FraudScoringRequest& request, const std::string& correlation_id);

    std::optional<RiskProfile> find_profile(const std::string& customer_id);

    void validate_request(const AssessmentRequest& request) const;

    // Transaction scored alongside the assessment: the explicit one, else the
    // latest history entry
    std::optional<FraudScoringRequest> scoped_transaction(const AssessmentRequest& request) const;

    int calculate_confidence(const AssessmentRequest& request,
                             const std::optional<FraudScoringOutcome>& fraud,
                             const std::vector<RiskFactor>& factors) const;

    static std::vector<std::string> recommendations_for(RiskCategory category);

    const ThresholdTable& thresholds() const { return thresholds_; }

private:
    void publish_assessment_event(const AssessmentRequest& request,
                                  const AssessmentResponse& response,
                                  const std::string& correlation_id);

    const Config& config_;
    ThresholdTable thresholds_;
    RiskRepository& repository_;
    EventPublisher& publisher_;
    RiskFactorAnalyzer analyzer_;
    FraudScorer scorer_;
    CustomerLockTable locks_;
};
