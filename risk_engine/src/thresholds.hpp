#pragma once

#include "types.hpp"

// Score -> category bands. Lower bounds are inclusive, the top band includes 1000.
//   [0, medium) LOW, [medium, high) MEDIUM, [high, critical) HIGH, [critical, 1000] CRITICAL
struct ThresholdTable {
    static constexpr int kMinScore = 0;
    static constexpr int kMaxScore = 1000;

    int medium = 200;
    int high = 500;
    int critical = 750;

    RiskCategory classify(int score) const;

    // Inclusive lower bound of a category's band
    int lower_bound(RiskCategory category) const;

    // Fraud alerts are raised from the HIGH band upward
    int alert_threshold() const { return high; }

    bool is_valid() const;
};

int clamp_score(double score);
