#include "risk_math.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace risk_math {

double clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, value));
}

double credit_risk(const std::optional<double>& credit_score) {
    if (!credit_score) {
        return kNeutralRisk;
    }
    // 850 is a perfect score, 500 and below is maximal risk
    return clamp01((850.0 - *credit_score) / 350.0);
}

double watchlist_risk(const std::optional<int>& matches) {
    if (!matches) {
        return kNeutralRisk;
    }
    return clamp01(0.5 * std::max(0, *matches));
}

double sanctions_risk(const std::optional<std::string>& status) {
    if (!status) {
        return kNeutralRisk;
    }
    std::string s = util::to_upper(util::trim(*status));
    if (s == "CLEAR") return 0.0;
    if (s == "PENDING") return 0.6;
    if (s == "HIT" || s == "MATCH") return 1.0;
    return kNeutralRisk;
}

double device_risk(const std::optional<double>& device_score) {
    if (!device_score) {
        return kNeutralRisk;
    }
    double score = *device_score;
    if (score > 1.0) {
        score /= 100.0;
    }
    return clamp01(score);
}

double identity_risk(const std::optional<std::string>& status) {
    if (!status) {
        return kNeutralRisk;
    }
    std::string s = util::to_upper(util::trim(*status));
    if (s == "VERIFIED") return 0.0;
    if (s == "PENDING") return 0.5;
    if (s == "FAILED" || s == "REJECTED") return 1.0;
    return kNeutralRisk;
}

double external_composite(const ExternalRiskFactors& factors) {
    return 0.25 * credit_risk(factors.credit_score) +
           0.25 * watchlist_risk(factors.watchlist_matches) +
           0.20 * sanctions_risk(factors.sanctions_check) +
           0.15 * device_risk(factors.device_risk_score) +
           0.15 * identity_risk(factors.identity_verification_status);
}

double market_risk(const std::map<std::string, double>& market_data) {
    double volatility_component = kNeutralRisk;
    double rate_component = kNeutralRisk;

    auto vol = market_data.find("market_volatility");
    if (vol != market_data.end()) {
        volatility_component = std::min(std::abs(vol->second) / 100.0, 1.0);
    }

    auto rate = market_data.find("interest_rates");
    if (rate != market_data.end()) {
        // Deviation from a 3% baseline
        rate_component = std::min(std::abs(rate->second - 3.0) / 10.0, 1.0);
    }

    return clamp01((volatility_component + rate_component) / 2.0);
}

double category_entropy(const std::vector<TransactionRecord>& history) {
    std::map<std::string, int> counts;
    for (const auto& record : history) {
        counts[record.category.empty() ? "UNCATEGORIZED" : record.category]++;
    }
    if (counts.size() <= 1) {
        return 0.0;
    }

    double total = static_cast<double>(history.size());
    double entropy = 0.0;
    for (const auto& [category, count] : counts) {
        double p = count / total;
        entropy -= p * std::log(p);
    }
    return clamp01(entropy / std::log(static_cast<double>(counts.size())));
}

SpendingStats spending_stats(const std::vector<TransactionRecord>& history) {
    SpendingStats stats;
    if (history.empty()) {
        return stats;
    }

    double n = static_cast<double>(history.size());
    double sum = 0.0;
    int high_value = 0;
    for (const auto& record : history) {
        sum += record.amount;
        if (record.amount > kHighValueAmount) {
            high_value++;
        }
    }
    double mean = sum / n;

    double squares = 0.0;
    for (const auto& record : history) {
        squares += (record.amount - mean) * (record.amount - mean);
    }
    double stddev = std::sqrt(squares / n);

    stats.high_value_ratio = high_value / n;
    stats.variability = mean > 0.0 ? std::min(stddev / mean, 1.0) : 0.0;
    stats.diversity = category_entropy(history);
    stats.average_amount = mean;
    stats.score = clamp01(0.3 * stats.high_value_ratio +
                          0.3 * stats.variability +
                          0.2 * stats.diversity +
                          0.2 * std::min(mean / kAverageAmountScale, 1.0));
    return stats;
}

double amount_points(double amount) {
    if (amount <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, std::min(400.0, 120.0 * std::log10(amount) - 115.0));
}

double surge_points(double ratio) {
    if (ratio <= 1.0) {
        return 0.0;
    }
    return std::min(250.0, 120.0 * std::log2(ratio));
}

double streak_points(int increasing_steps) {
    return std::min(300.0, 100.0 * std::max(0, increasing_steps));
}

double frequency_points(int count, int spike_count) {
    if (count < spike_count) {
        return 0.0;
    }
    return std::min(200.0, 50.0 * (count - spike_count + 1));
}

double fraud_confidence(int fraud_score) {
    if (fraud_score >= 800 || fraud_score <= 100) {
        return 0.95;
    }
    if (fraud_score >= 600 || fraud_score <= 200) {
        return 0.85;
    }
    return 0.70;
}

double weighted_mean(const std::vector<std::pair<double, double>>& scored) {
    double total = 0.0;
    double weights = 0.0;
    for (const auto& [score, weight] : scored) {
        total += score * weight;
        weights += weight;
    }
    return weights > 0.0 ? total / weights : 0.0;
}

} // namespace risk_math
