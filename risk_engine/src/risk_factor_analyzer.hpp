#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// Turns raw customer signals into the fixed, ordered set of weighted factors.
// Never fails on missing optional data; only an empty customer id is rejected.
class RiskFactorAnalyzer {
public:
    static constexpr double kSpendingWeight = 0.30;
    static constexpr double kCreditWeight = 0.15;
    static constexpr double kWatchlistWeight = 0.15;
    static constexpr double kSanctionsWeight = 0.15;
    static constexpr double kDeviceWeight = 0.10;
    static constexpr double kIdentityWeight = 0.10;
    static constexpr double kMarketWeight = 0.05;
    static constexpr double kInsufficientHistoryScore = 0.45;

    std::vector<RiskFactor> analyze(const AssessmentRequest& request, const std::string& profile_id) const;

    RiskFactor analyze_spending(const std::vector<TransactionRecord>& history) const;
    RiskFactor analyze_credit(const ExternalRiskFactors& external) const;
    RiskFactor analyze_watchlist(const ExternalRiskFactors& external) const;
    RiskFactor analyze_sanctions(const ExternalRiskFactors& external) const;
    RiskFactor analyze_device(const ExternalRiskFactors& external) const;
    RiskFactor analyze_identity(const ExternalRiskFactors& external) const;
    RiskFactor analyze_market(const std::map<std::string, double>& market_data) const;
};

// 1000 * weighted mean of the factor scores
double factor_score(const std::vector<RiskFactor>& factors);
