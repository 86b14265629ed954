#pragma once

#include "scoring_backend.hpp"

// Deterministic in-process model: amount, external customer risk and missing
// request context.
class HeuristicScoringBackend : public FraudScoringBackend {
public:
    static constexpr double kExternalScale = 450.0;
    static constexpr double kMissingContextPoints = 20.0;

    ScoringResult score(const ScoringContext& context) override;
    std::string name() const override { return "heuristic"; }
};
