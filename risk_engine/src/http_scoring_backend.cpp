#include "http_scoring_backend.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

HttpScoringBackend::HttpScoringBackend(const Config& config)
    : config_(config), endpoint_(config.scoring_url + "/api/v1/ai/fraud-detection") {}

ScoringResult HttpScoringBackend::score(const ScoringContext& context) {
    json body = context.request.to_json();
    body["recent_transaction_count"] = context.recent_transaction_count;

    cpr::Response response = cpr::Post(
        cpr::Url{endpoint_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{config_.scoring_timeout_ms}
    );

    if (response.error) {
        spdlog::warn("Fraud model request for {} failed: {}", context.request.transaction_id,
                     response.error.message);
        return ScoringResult::unavailable(response.error.message.empty()
                                              ? "fraud model unreachable"
                                              : response.error.message);
    }

    return parse_response(response.status_code, response.text);
}

ScoringResult HttpScoringBackend::parse_response(long status_code, const std::string& body) {
    if (status_code >= 500 || status_code == 0) {
        return ScoringResult::unavailable(fmt::format("fraud model returned HTTP {}", status_code));
    }
    if (status_code >= 400) {
        return ScoringResult::fatal(fmt::format("fraud model rejected request with HTTP {}", status_code));
    }

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ScoringResult::fatal("fraud model returned a malformed body");
    }
    if (!j.contains("fraud_score") || !j.at("fraud_score").is_number()) {
        return ScoringResult::fatal("fraud model response has no fraud_score");
    }

    double probability = j.at("fraud_score").get<double>();
    if (probability < 0.0 || probability > 1.0) {
        return ScoringResult::fatal(fmt::format("fraud model score {} out of range", probability));
    }

    std::vector<std::string> reasons;
    if (j.contains("reason") && j.at("reason").is_string() && !j.at("reason").get<std::string>().empty()) {
        reasons.push_back(j.at("reason").get<std::string>());
    }
    if (j.value("is_fraud", false)) {
        reasons.push_back("Fraud model classified the transaction as fraudulent");
    }

    return ScoringResult::success(1000.0 * probability, std::move(reasons));
}
