#pragma once

#include "risk_assessment_engine.hpp"
#include "types.hpp"

// Maps request envelopes onto engine calls and every outcome onto a reply.
//   assess   payload: AssessmentRequest          -> AssessmentResponse
//   score    payload: FraudScoringRequest        -> FraudScoreResult
//   profile  payload: {"customer_id": "..."}     -> RiskProfile or null
class CommandHandler {
public:
    explicit CommandHandler(RiskAssessmentEngine& engine);

    CommandReply handle(const CommandRequest& request);

private:
    nlohmann::json handle_assess(const CommandRequest& request);
    nlohmann::json handle_score(const CommandRequest& request);
    nlohmann::json handle_profile(const CommandRequest& request);

    RiskAssessmentEngine& engine_;
};
