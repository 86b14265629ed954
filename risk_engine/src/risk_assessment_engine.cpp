#include "risk_assessment_engine.hpp"
#include "errors.hpp"
#include "risk_math.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    constexpr double kAgreementSpread = 0.35;

    const std::vector<std::string> kLowRecommendations = {
        "Continue standard monitoring procedures"
    };
    const std::vector<std::string> kMediumRecommendations = {
        "Apply enhanced transaction monitoring",
        "Consider periodic risk reassessment"
    };
    const std::vector<std::string> kHighRecommendations = {
        "Implement enhanced due diligence procedures",
        "Require manual review for high-value transactions"
    };
    const std::vector<std::string> kCriticalRecommendations = {
        "Consider additional identity verification measures"
    };

    const TransactionRecord* latest_record(const std::vector<TransactionRecord>& history) {
        const TransactionRecord* latest = nullptr;
        for (const auto& record : history) {
            if (!latest || record.timestamp >= latest->timestamp) {
                latest = &record;
            }
        }
        return latest;
    }

    std::vector<RiskFactor> explain(std::vector<RiskFactor> factors, int depth) {
        std::stable_sort(factors.begin(), factors.end(), [](const RiskFactor& a, const RiskFactor& b) {
            return a.score * a.weight > b.score * b.weight;
        });
        size_t keep = static_cast<size_t>(std::max(0, depth));
        if (factors.size() > keep) {
            factors.resize(keep);
        }
        return factors;
    }
}

RiskAssessmentEngine::RiskAssessmentEngine(const Config& config,
                                           RiskRepository& repository,
                                           FraudScoringBackend& backend,
                                           TransactionWindowStore& window,
                                           EventPublisher& publisher)
    : config_(config),
      thresholds_(config.thresholds()),
      repository_(repository),
      publisher_(publisher),
      scorer_(config, backend, window) {}

void RiskAssessmentEngine::validate_request(const AssessmentRequest& request) const {
    if (util::trim(request.customer_id).empty()) {
        throw ValidationError("customer_id", "must not be empty");
    }

    for (const auto& record : request.transaction_history) {
        if (!std::isfinite(record.amount) || record.amount < 0.0) {
            throw ValidationError("transaction_history.amount", "must be a non-negative number");
        }
    }

    if (request.transaction && request.transaction->customer_id != request.customer_id) {
        throw ValidationError("transaction.customer_id", "does not match the assessed customer");
    }

    if (auto transaction = scoped_transaction(request)) {
        validate_transaction(*transaction);
    }
}

std::optional<FraudScoringRequest> RiskAssessmentEngine::scoped_transaction(const AssessmentRequest& request) const {
    if (request.transaction) {
        return request.transaction;
    }

    const TransactionRecord* latest = latest_record(request.transaction_history);
    if (!latest) {
        return std::nullopt;
    }

    FraudScoringRequest transaction;
    transaction.transaction_id = latest->id.empty()
        ? util::hash_identifier(request.customer_id + "|" + util::format_iso8601(latest->timestamp) +
                                "|" + fmt::format("{:.2f}", latest->amount))
        : latest->id;
    transaction.customer_id = request.customer_id;
    transaction.amount = latest->amount;
    transaction.currency = latest->currency;
    transaction.timestamp = latest->timestamp;
    transaction.merchant_info = latest->merchant;
    transaction.external_risk = request.external_risk_factors;
    return transaction;
}

AssessmentResponse RiskAssessmentEngine::assess(const AssessmentRequest& request) {
    validate_request(request);

    const std::string& customer_id = request.customer_id;
    auto transaction = scoped_transaction(request);
    std::string correlation_id = request.correlation_id.empty() ? util::generate_uuid() : request.correlation_id;

    AssessmentResponse response;
    response.assessment_id = util::generate_uuid();
    response.customer_id = customer_id;

    std::optional<FraudScoringOutcome> fraud;

    auto guard = locks_.acquire(customer_id);

    try {
        auto session = repository_.open_session();

        auto profile = session->profiles().find_by_customer_id(customer_id);
        if (!profile) {
            RiskProfile baseline;
            baseline.customer_id = customer_id;
            baseline.current_score = 0;
            baseline.category = RiskCategory::UNKNOWN;
            baseline.created_at = std::chrono::system_clock::now();
            profile = session->profiles().save(baseline);
            spdlog::info("Created baseline risk profile {} for customer {}", profile->id, customer_id);
        }
        const std::string profile_id = profile->id;

        std::vector<RiskFactor> factors;
        std::future<std::vector<RiskFactor>> pending_factors;
        if (config_.parallel_analysis) {
            pending_factors = std::async(std::launch::async, [this, &request, profile_id] {
                return analyzer_.analyze(request, profile_id);
            });
        }

        if (transaction) {
            fraud = scorer_.score(*transaction, session->alerts());
        }

        factors = config_.parallel_analysis ? pending_factors.get() : analyzer_.analyze(request, profile_id);

        double factor_component = factor_score(factors);
        double blend = config_.fraud_blend_weight;
        double final_score = factor_component;

        if (fraud && fraud->ok()) {
            response.fraud_score = fraud->result.fraud_score;
            response.fraud_recommendation = fraud->result.recommendation;
            final_score = blend * fraud->result.fraud_score + (1.0 - blend) * factor_component;
        } else if (fraud) {
            response.fallback_applied = true;
            // The fallback may raise the factor score, never lower it
            final_score = blend * config_.fallback_fraud_score + (1.0 - blend) * factor_component;
            final_score = std::max({final_score, factor_component,
                                    static_cast<double>(thresholds_.lower_bound(RiskCategory::MEDIUM))});
        }

        response.risk_score = clamp_score(final_score);
        response.risk_category = thresholds_.classify(response.risk_score);
        response.confidence_interval = calculate_confidence(request, fraud, factors);
        response.mitigation_recommendations = recommendations_for(response.risk_category);
        if (response.fallback_applied) {
            response.mitigation_recommendations.push_back(
                fmt::format("Fraud scoring unavailable: conservative fallback applied ({})",
                            fraud->unavailable_reason));
        }
        response.is_high_risk = response.risk_category == RiskCategory::HIGH ||
                                response.risk_category == RiskCategory::CRITICAL;
        response.requires_manual_review = response.risk_category == RiskCategory::CRITICAL;
        response.assessment_timestamp = std::chrono::system_clock::now();
        response.risk_factors = explain(factors, request.explainability.depth);

        RiskScore score;
        score.id = util::generate_uuid();
        score.assessment_id = response.assessment_id;
        score.profile_id = profile_id;
        score.score = response.risk_score;
        score.category = response.risk_category;
        score.confidence = static_cast<int>(response.confidence_interval);
        score.assessment_date = response.assessment_timestamp;
        session->scores().save(score);

        session->factors().save(profile_id, factors);

        profile->current_score = response.risk_score;
        profile->category = response.risk_category;
        profile->last_assessed_at = response.assessment_timestamp;
        session->profiles().save(*profile);

        session->commit();
        if (fraud) {
            scorer_.record_window(*fraud);
        }
    } catch (const ValidationError&) {
        throw;
    } catch (const ConcurrencyConflictError& e) {
        spdlog::warn("Assessment for customer {} lost a concurrent update: {}", customer_id, e.what());
        throw RiskAssessmentException(customer_id, e.what(), std::current_exception(), true);
    } catch (const std::exception& e) {
        spdlog::error("Assessment for customer {} failed: {}", customer_id, e.what());
        throw RiskAssessmentException(customer_id, e.what(), std::current_exception());
    }

    spdlog::info("Assessed customer {}: score {} ({}), confidence {}{}",
                 customer_id, response.risk_score, to_string(response.risk_category),
                 response.confidence_interval, response.fallback_applied ? ", fallback applied" : "");

    publish_assessment_event(request, response, correlation_id);
    if (fraud) {
        scorer_.publish_alert_event(*fraud, publisher_, correlation_id);
    }

    return response;
}

FraudScoreResult RiskAssessmentEngine::score_transaction(const FraudScoringRequest& request,
                                                         const std::string& correlation_id) {
    validate_transaction(request);

    FraudScoringOutcome outcome;
    {
        auto guard = locks_.acquire(request.customer_id);
        try {
            auto session = repository_.open_session();
            outcome = scorer_.score(request, session->alerts());
            session->commit();
            scorer_.record_window(outcome);
        } catch (const ValidationError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Fraud scoring for transaction {} failed: {}", request.transaction_id, e.what());
            bool retryable = dynamic_cast<const ConcurrencyConflictError*>(&e) != nullptr;
            throw RiskAssessmentException(request.customer_id, e.what(), std::current_exception(), retryable);
        }
    }

    if (!outcome.ok()) {
        FraudScoreResult fallback;
        fallback.transaction_id = request.transaction_id;
        fallback.fraud_score = config_.fallback_fraud_score;
        fallback.risk_level = thresholds_.classify(fallback.fraud_score);
        fallback.recommendation = Recommendation::REVIEW;
        fallback.confidence_score = kFallbackFraudConfidence;
        fallback.reasons.push_back(fmt::format("Fraud scoring unavailable: conservative fallback applied ({})",
                                               outcome.unavailable_reason));
        return fallback;
    }

    scorer_.publish_alert_event(outcome, publisher_, correlation_id);
    return outcome.result;
}

std::optional<RiskProfile> RiskAssessmentEngine::find_profile(const std::string& customer_id) {
    if (util::trim(customer_id).empty()) {
        throw ValidationError("customer_id", "must not be empty");
    }

    try {
        auto session = repository_.open_session();
        return session->profiles().find_by_customer_id(customer_id);
    } catch (const std::exception& e) {
        throw RiskAssessmentException(customer_id, e.what(), std::current_exception());
    }
}

int RiskAssessmentEngine::calculate_confidence(const AssessmentRequest& request,
                                               const std::optional<FraudScoringOutcome>& fraud,
                                               const std::vector<RiskFactor>& factors) const {
    // Risk level in [0, 1] of every signal actually present
    std::vector<double> signals;
    if (fraud && fraud->ok()) {
        signals.push_back(fraud->result.fraud_score / static_cast<double>(ThresholdTable::kMaxScore));
    }
    if (!request.transaction_history.empty()) {
        signals.push_back(factors.empty() ? risk_math::spending_stats(request.transaction_history).score
                                          : factors.front().score);
    }
    if (!request.external_risk_factors.empty()) {
        signals.push_back(risk_math::external_composite(request.external_risk_factors));
    }
    if (!request.market_data.empty()) {
        signals.push_back(risk_math::market_risk(request.market_data));
    }

    int confidence = 25 + 10 * static_cast<int>(signals.size());

    if (const TransactionRecord* latest = latest_record(request.transaction_history)) {
        auto age = request.request_timestamp - latest->timestamp;
        if (age <= std::chrono::hours(24)) {
            confidence += 10;
        } else if (age <= std::chrono::hours(24 * 30)) {
            confidence += 5;
        }
    }

    bool agree = false;
    for (size_t i = 0; i < signals.size() && !agree; ++i) {
        for (size_t j = i + 1; j < signals.size(); ++j) {
            if (std::abs(signals[i] - signals[j]) <= kAgreementSpread) {
                agree = true;
                break;
            }
        }
    }

    confidence = agree ? confidence + 15 : std::min(confidence, 60);
    return std::max(0, std::min(100, confidence));
}

std::vector<std::string> RiskAssessmentEngine::recommendations_for(RiskCategory category) {
    std::vector<std::string> result = kLowRecommendations;

    auto add = [&result](const std::vector<std::string>& more) {
        result.insert(result.end(), more.begin(), more.end());
    };

    switch (category) {
        case RiskCategory::CRITICAL:
            add(kMediumRecommendations);
            add(kHighRecommendations);
            add(kCriticalRecommendations);
            break;
        case RiskCategory::HIGH:
            add(kMediumRecommendations);
            add(kHighRecommendations);
            break;
        case RiskCategory::MEDIUM:
            add(kMediumRecommendations);
            break;
        case RiskCategory::LOW:
        case RiskCategory::UNKNOWN:
            break;
    }
    return result;
}

void RiskAssessmentEngine::publish_assessment_event(const AssessmentRequest& request,
                                                    const AssessmentResponse& response,
                                                    const std::string& correlation_id) {
    AssessmentEvent event;
    event.event_id = util::generate_uuid();
    event.timestamp = response.assessment_timestamp;
    event.customer_id = request.customer_id;
    event.correlation_id = correlation_id;
    event.priority_level = response.is_high_risk ? PriorityLevel::HIGH : PriorityLevel::NORMAL;
    event.request_echo = request.to_json();
    event.metadata = {
        {"final_risk_score", response.risk_score},
        {"risk_category", to_string(response.risk_category)},
        {"confidence_level", response.confidence_interval},
        {"requires_manual_review", response.requires_manual_review},
        {"recommendation_count", response.mitigation_recommendations.size()},
        {"customer_id_hash", util::hash_identifier(request.customer_id)},
        {"event_version", kEventVersion}
    };

    try {
        publisher_.publish(config_.topic_assessment_events, request.customer_id, event.to_json());
    } catch (const std::exception& e) {
        spdlog::warn("Failed to publish assessment event for customer {}: {}", request.customer_id, e.what());
    }
}
