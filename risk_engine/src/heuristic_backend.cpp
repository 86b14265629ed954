#include "heuristic_backend.hpp"
#include "risk_math.hpp"
#include <fmt/format.h>

ScoringResult HeuristicScoringBackend::score(const ScoringContext& context) {
    const auto& request = context.request;
    if (!request.amount) {
        return ScoringResult::fatal("amount missing");
    }

    std::vector<std::string> reasons;

    double amount = *request.amount;
    double points = risk_math::amount_points(amount);
    if (amount > risk_math::kHighValueAmount) {
        reasons.push_back(fmt::format("High transaction amount: {:.2f} {}", amount, request.currency));
    }

    double composite = risk_math::external_composite(request.external_risk);
    points += kExternalScale * composite;
    if (composite >= 0.5) {
        reasons.push_back(fmt::format("Elevated external customer risk ({:.2f})", composite));
    }

    if (request.ip_address) {
        reasons.push_back("IP address included in analysis");
    } else {
        points += kMissingContextPoints;
        reasons.push_back("IP address not provided");
    }

    if (request.device_fingerprint) {
        reasons.push_back("Device fingerprint included in analysis");
    } else {
        points += kMissingContextPoints;
        reasons.push_back("Device fingerprint not provided");
    }

    return ScoringResult::success(points, std::move(reasons));
}
