#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Pure scoring functions shared by the factor analyzer, the fraud scorer and the
// heuristic backend. Every *_risk function returns a value in [0, 1]; missing
// inputs map to the neutral 0.5.
namespace risk_math {

constexpr double kNeutralRisk = 0.5;
constexpr double kHighValueAmount = 10000.0;
constexpr double kAverageAmountScale = 50000.0;

double clamp01(double value);

// External customer signals
double credit_risk(const std::optional<double>& credit_score);
double watchlist_risk(const std::optional<int>& matches);
double sanctions_risk(const std::optional<std::string>& status);
double device_risk(const std::optional<double>& device_score);
double identity_risk(const std::optional<std::string>& status);

// credit .25, watchlist .25, sanctions .20, device .15, identity .15
double external_composite(const ExternalRiskFactors& factors);

// Market context: "market_volatility" and "interest_rates"
double market_risk(const std::map<std::string, double>& market_data);

// Transaction history
struct SpendingStats {
    double high_value_ratio = 0.0;
    double variability = 0.0;   // stddev / mean, capped at 1
    double diversity = 0.0;     // normalised category entropy
    double average_amount = 0.0;
    double score = 0.0;
};

SpendingStats spending_stats(const std::vector<TransactionRecord>& history);
double category_entropy(const std::vector<TransactionRecord>& history);

// Fraud points
double amount_points(double amount);
double surge_points(double ratio);
double streak_points(int increasing_steps);
double frequency_points(int count, int spike_count);

double fraud_confidence(int fraud_score);

// Weighted mean over (score, weight) pairs, 0 when the weights sum to 0
double weighted_mean(const std::vector<std::pair<double, double>>& scored);

} // namespace risk_math
