#include "risk_factor_analyzer.hpp"
#include "errors.hpp"
#include "risk_math.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    RiskFactor make_factor(const std::string& name, double score, double weight,
                           const std::string& description, const std::string& source) {
        RiskFactor factor;
        factor.name = name;
        factor.score = risk_math::clamp01(score);
        factor.weight = weight;
        factor.description = description;
        factor.data_source = source;
        return factor;
    }

    const char* kNeutral = "not provided, neutral score applied";
}

std::vector<RiskFactor> RiskFactorAnalyzer::analyze(const AssessmentRequest& request,
                                                    const std::string& profile_id) const {
    if (request.customer_id.empty()) {
        throw ValidationError("customer_id", "must not be empty");
    }

    std::vector<RiskFactor> factors;
    factors.reserve(7);
    factors.push_back(analyze_spending(request.transaction_history));
    factors.push_back(analyze_credit(request.external_risk_factors));
    factors.push_back(analyze_watchlist(request.external_risk_factors));
    factors.push_back(analyze_sanctions(request.external_risk_factors));
    factors.push_back(analyze_device(request.external_risk_factors));
    factors.push_back(analyze_identity(request.external_risk_factors));
    factors.push_back(analyze_market(request.market_data));

    for (auto& factor : factors) {
        factor.profile_id = profile_id;
        factor.calculated_at = request.request_timestamp;
    }

    spdlog::debug("Analyzed {} risk factors for customer {}", factors.size(), request.customer_id);
    return factors;
}

RiskFactor RiskFactorAnalyzer::analyze_spending(const std::vector<TransactionRecord>& history) const {
    if (history.empty()) {
        return make_factor("INSUFFICIENT_HISTORY", kInsufficientHistoryScore, kSpendingWeight,
                           "No transaction history available, elevated baseline risk applied",
                           "transaction_history");
    }

    auto stats = risk_math::spending_stats(history);
    return make_factor("SPENDING_PATTERNS", stats.score, kSpendingWeight,
                       fmt::format("{} transactions, average amount {:.2f}, {:.0f}% above {:.0f}, "
                                   "variability {:.2f}, category diversity {:.2f}",
                                   history.size(), stats.average_amount,
                                   stats.high_value_ratio * 100.0, risk_math::kHighValueAmount,
                                   stats.variability, stats.diversity),
                       "transaction_history");
}

RiskFactor RiskFactorAnalyzer::analyze_credit(const ExternalRiskFactors& external) const {
    double score = risk_math::credit_risk(external.credit_score);
    std::string description = external.credit_score
        ? fmt::format("Credit score {:.0f}", *external.credit_score)
        : fmt::format("Credit score {}", kNeutral);
    return make_factor("CREDIT_PROFILE", score, kCreditWeight, description, "credit_bureau");
}

RiskFactor RiskFactorAnalyzer::analyze_watchlist(const ExternalRiskFactors& external) const {
    double score = risk_math::watchlist_risk(external.watchlist_matches);
    std::string description = external.watchlist_matches
        ? fmt::format("{} watchlist match(es)", *external.watchlist_matches)
        : fmt::format("Watchlist screening {}", kNeutral);
    return make_factor("WATCHLIST_SCREENING", score, kWatchlistWeight, description, "watchlist_screening");
}

RiskFactor RiskFactorAnalyzer::analyze_sanctions(const ExternalRiskFactors& external) const {
    double score = risk_math::sanctions_risk(external.sanctions_check);
    std::string description = external.sanctions_check
        ? fmt::format("Sanctions check status {}", *external.sanctions_check)
        : fmt::format("Sanctions check {}", kNeutral);
    return make_factor("SANCTIONS_STATUS", score, kSanctionsWeight, description, "sanctions_screening");
}

RiskFactor RiskFactorAnalyzer::analyze_device(const ExternalRiskFactors& external) const {
    double score = risk_math::device_risk(external.device_risk_score);
    std::string description = external.device_risk_score
        ? fmt::format("Device risk score {:.2f}", score)
        : fmt::format("Device risk {}", kNeutral);
    return make_factor("DEVICE_RISK", score, kDeviceWeight, description, "device_intelligence");
}

RiskFactor RiskFactorAnalyzer::analyze_identity(const ExternalRiskFactors& external) const {
    double score = risk_math::identity_risk(external.identity_verification_status);
    std::string description = external.identity_verification_status
        ? fmt::format("Identity verification status {}", *external.identity_verification_status)
        : fmt::format("Identity verification {}", kNeutral);
    return make_factor("IDENTITY_VERIFICATION", score, kIdentityWeight, description, "identity_verification");
}

RiskFactor RiskFactorAnalyzer::analyze_market(const std::map<std::string, double>& market_data) const {
    double score = risk_math::market_risk(market_data);
    std::string description = market_data.empty()
        ? fmt::format("Market data {}", kNeutral)
        : fmt::format("Market volatility and interest rate environment ({} indicators)", market_data.size());
    return make_factor("MARKET_CONDITIONS", score, kMarketWeight, description, "market_data");
}

double factor_score(const std::vector<RiskFactor>& factors) {
    std::vector<std::pair<double, double>> scored;
    scored.reserve(factors.size());
    for (const auto& factor : factors) {
        scored.emplace_back(factor.score, factor.weight);
    }
    return 1000.0 * risk_math::weighted_mean(scored);
}
