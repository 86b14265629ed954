#include "thresholds.hpp"
#include <algorithm>
#include <cmath>

RiskCategory ThresholdTable::classify(int score) const {
    int s = std::max(kMinScore, std::min(kMaxScore, score));
    if (s >= critical) {
        return RiskCategory::CRITICAL;
    }
    if (s >= high) {
        return RiskCategory::HIGH;
    }
    if (s >= medium) {
        return RiskCategory::MEDIUM;
    }
    return RiskCategory::LOW;
}

int ThresholdTable::lower_bound(RiskCategory category) const {
    switch (category) {
        case RiskCategory::CRITICAL: return critical;
        case RiskCategory::HIGH: return high;
        case RiskCategory::MEDIUM: return medium;
        case RiskCategory::LOW:
        case RiskCategory::UNKNOWN:
            break;
    }
    return kMinScore;
}

bool ThresholdTable::is_valid() const {
    return kMinScore < medium && medium < high && high < critical && critical <= kMaxScore;
}

int clamp_score(double score) {
    if (std::isnan(score)) {
        return ThresholdTable::kMinScore;
    }
    double bounded = std::max<double>(ThresholdTable::kMinScore,
                                      std::min<double>(ThresholdTable::kMaxScore, score));
    return static_cast<int>(std::lround(bounded));
}
