#pragma once

#include "config.hpp"
#include "event_publisher.hpp"
#include "scoring_backend.hpp"
#include "stores.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Throws ValidationError: non-empty ids, amount present and positive,
// currency a three-letter alphabetic code.
void validate_transaction(const FraudScoringRequest& request);

struct VelocityEscalation {
    double surge_points = 0.0;
    double streak_points = 0.0;
    double frequency_points = 0.0;
    std::vector<std::string> reasons;

    double total() const { return surge_points + streak_points + frequency_points; }
    bool fired() const { return total() > 0.0; }
};

struct FraudScoringOutcome {
    ScoringResult::Status status = ScoringResult::Status::Success;
    FraudScoreResult result;           // filled on Success
    std::string unavailable_reason;    // filled on Unavailable
    std::optional<FraudDetectionEvent> alert_event;
    std::string customer_id;
    std::optional<WindowEntry> window_entry;  // recorded once the caller commits

    bool ok() const { return status == ScoringResult::Status::Success; }
};

class FraudScorer {
public:
    FraudScorer(const Config& config, FraudScoringBackend& backend, TransactionWindowStore& window);

    // Scores one transaction. The alert, if any, is written through `alerts` so
    // that it shares the caller's unit of work. Throws ValidationError on bad
    // input and FraudScoringError when the backend reports a fatal error.
    FraudScoringOutcome score(const FraudScoringRequest& request, AlertStore& alerts);

    // Appends the scored transaction to the customer's velocity window. Call only
    // after the caller's unit of work has committed; failures are logged.
    void record_window(const FraudScoringOutcome& outcome);

    // Publishes the outcome's fraud event once the caller has committed
    void publish_alert_event(const FraudScoringOutcome& outcome, EventPublisher& publisher,
                             const std::string& correlation_id) const;

    VelocityEscalation evaluate_velocity(const FraudScoringRequest& request,
                                         const std::vector<WindowEntry>& window) const;

    Recommendation decide(int fraud_score, RiskCategory level, bool escalated) const;

    static constexpr int kChallengeScore = 625;

private:
    const Config& config_;
    ThresholdTable thresholds_;
    FraudScoringBackend& backend_;
    TransactionWindowStore& window_;
};
