#include "fraud_scorer.hpp"
#include "errors.hpp"
#include "risk_math.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cmath>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    std::string band_name(RiskCategory level) {
        switch (level) {
            case RiskCategory::CRITICAL: return "Critical";
            case RiskCategory::HIGH: return "High";
            case RiskCategory::MEDIUM: return "Medium";
            default: return "Low";
        }
    }
}

void validate_transaction(const FraudScoringRequest& request) {
    if (util::trim(request.transaction_id).empty()) {
        throw ValidationError("transaction_id", "must not be empty");
    }
    if (util::trim(request.customer_id).empty()) {
        throw ValidationError("customer_id", "must not be empty");
    }
    if (!request.amount) {
        throw ValidationError("amount", "is required");
    }
    if (!std::isfinite(*request.amount) || *request.amount <= 0.0) {
        throw ValidationError("amount", "must be greater than zero");
    }
    bool currency_ok = request.currency.size() == 3 &&
        std::all_of(request.currency.begin(), request.currency.end(), [](unsigned char c) {
            return std::isalpha(c) != 0;
        });
    if (!currency_ok) {
        throw ValidationError("currency", "must be a three-letter currency code");
    }
}

FraudScorer::FraudScorer(const Config& config, FraudScoringBackend& backend, TransactionWindowStore& window)
    : config_(config), thresholds_(config.thresholds()), backend_(backend), window_(window) {}

FraudScoringOutcome FraudScorer::score(const FraudScoringRequest& request, AlertStore& alerts) {
    validate_transaction(request);

    std::vector<WindowEntry> window;
    try {
        window = window_.load(request.customer_id, config_.velocity_window_size);
    } catch (const std::exception& e) {
        spdlog::warn("Transaction window unavailable for customer {}: {}", request.customer_id, e.what());
    }

    ScoringContext context{request, static_cast<int>(window.size())};
    ScoringResult base;
    try {
        base = backend_.score(context);
    } catch (const std::exception& e) {
        base = ScoringResult::unavailable(e.what());
    }

    if (base.status == ScoringResult::Status::Fatal) {
        spdlog::error("Scoring backend {} failed for transaction {}: {}",
                      backend_.name(), request.transaction_id, base.error);
        throw FraudScoringError(request.transaction_id, base.error);
    }

    // Appended by record_window once the caller commits, scored or not
    FraudScoringOutcome outcome;
    outcome.result.transaction_id = request.transaction_id;
    outcome.customer_id = request.customer_id;
    outcome.window_entry = WindowEntry{request.transaction_id, *request.amount, request.timestamp};

    if (base.status == ScoringResult::Status::Unavailable) {
        spdlog::warn("Scoring backend {} unavailable for transaction {}: {}",
                     backend_.name(), request.transaction_id, base.error);
        outcome.status = ScoringResult::Status::Unavailable;
        outcome.unavailable_reason = base.error.empty() ? "scoring backend unavailable" : base.error;
        return outcome;
    }

    auto escalation = evaluate_velocity(request, window);

    int fraud_score = clamp_score(base.base_score + escalation.total());
    RiskCategory level = thresholds_.classify(fraud_score);

    auto& result = outcome.result;
    result.fraud_score = fraud_score;
    result.risk_level = level;
    result.recommendation = decide(fraud_score, level, escalation.fired());
    result.confidence_score = risk_math::fraud_confidence(fraud_score);
    result.requires_manual_review = result.recommendation == Recommendation::BLOCK;

    result.reasons.push_back(fmt::format("{} fraud score detected: {}/{}",
                                         band_name(level), fraud_score, ThresholdTable::kMaxScore));
    result.reasons.insert(result.reasons.end(), base.reasons.begin(), base.reasons.end());
    result.reasons.insert(result.reasons.end(), escalation.reasons.begin(), escalation.reasons.end());

    if (fraud_score >= thresholds_.alert_threshold()) {
        FraudAlert alert;
        alert.id = util::generate_uuid();
        alert.transaction_id = request.transaction_id;
        alert.customer_id = request.customer_id;
        alert.reason = fmt::format("{}", fmt::join(result.reasons, "; "));
        alert.risk_score_ref = fraud_score;
        alert.status = AlertStatus::NEW;
        alert.timestamp = std::chrono::system_clock::now();

        alerts.save(alert);
        result.alert_raised = true;

        FraudDetectionEvent event;
        event.event_id = util::generate_uuid();
        event.timestamp = alert.timestamp;
        event.transaction_id = request.transaction_id;
        event.customer_id = request.customer_id;
        event.fraud_score = fraud_score;
        event.risk_level = level;
        event.recommendation = result.recommendation;
        outcome.alert_event = event;

        spdlog::warn("Fraud alert raised for transaction {} (score {}, {})",
                     request.transaction_id, fraud_score, to_string(level));
    }

    spdlog::info("Scored transaction {} for customer {}: {} ({}, {})",
                 request.transaction_id, request.customer_id, fraud_score,
                 to_string(level), to_string(result.recommendation));
    return outcome;
}

void FraudScorer::record_window(const FraudScoringOutcome& outcome) {
    if (!outcome.window_entry) {
        return;
    }

    try {
        window_.append(outcome.customer_id, *outcome.window_entry, config_.velocity_window_size);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to record transaction {} in window: {}",
                     outcome.window_entry->transaction_id, e.what());
    }
}

void FraudScorer::publish_alert_event(const FraudScoringOutcome& outcome, EventPublisher& publisher,
                                      const std::string& correlation_id) const {
    if (!outcome.alert_event) {
        return;
    }

    FraudDetectionEvent event = *outcome.alert_event;
    event.correlation_id = correlation_id;
    try {
        publisher.publish(config_.topic_fraud_events, event.transaction_id, event.to_json());
    } catch (const std::exception& e) {
        spdlog::warn("Failed to publish fraud event for transaction {}: {}", event.transaction_id, e.what());
    }
}

VelocityEscalation FraudScorer::evaluate_velocity(const FraudScoringRequest& request,
                                                  const std::vector<WindowEntry>& window) const {
    VelocityEscalation escalation;
    if (!request.amount) {
        return escalation;
    }

    auto horizon = request.timestamp - std::chrono::minutes(config_.velocity_window_minutes);
    std::vector<WindowEntry> prior;
    for (const auto& entry : window) {
        if (entry.transaction_id != request.transaction_id &&
            entry.timestamp <= request.timestamp && entry.timestamp > horizon) {
            prior.push_back(entry);
        }
    }
    std::stable_sort(prior.begin(), prior.end(), [](const WindowEntry& a, const WindowEntry& b) {
        return a.timestamp < b.timestamp;
    });

    // The current transaction takes one slot of the window
    size_t max_prior = static_cast<size_t>(std::max(0, config_.velocity_window_size - 1));
    if (prior.size() > max_prior) {
        prior.erase(prior.begin(), prior.end() - static_cast<std::ptrdiff_t>(max_prior));
    }

    double amount = *request.amount;

    if (!prior.empty() && prior.back().amount > 0.0) {
        double ratio = amount / prior.back().amount;
        if (ratio >= config_.surge_ratio) {
            escalation.surge_points = risk_math::surge_points(ratio);
            escalation.reasons.push_back(fmt::format("Amount surge: {:.1f}x the previous transaction", ratio));
        }
    }

    int steps = 0;
    double next = amount;
    for (auto it = prior.rbegin(); it != prior.rend(); ++it) {
        if (next > it->amount) {
            steps++;
            next = it->amount;
        } else {
            break;
        }
    }
    if (steps > 0) {
        escalation.streak_points = risk_math::streak_points(steps);
        escalation.reasons.push_back(fmt::format("Increasing amounts over {} consecutive transactions", steps + 1));
    }

    auto frequency_horizon = request.timestamp - std::chrono::minutes(config_.frequency_window_minutes);
    int recent = 1 + static_cast<int>(std::count_if(prior.begin(), prior.end(), [&](const WindowEntry& e) {
        return e.timestamp > frequency_horizon;
    }));
    if (recent >= config_.frequency_spike_count) {
        escalation.frequency_points = risk_math::frequency_points(recent, config_.frequency_spike_count);
        escalation.reasons.push_back(fmt::format("{} transactions within {} minutes",
                                                 recent, config_.frequency_window_minutes));
    }

    return escalation;
}

Recommendation FraudScorer::decide(int fraud_score, RiskCategory level, bool escalated) const {
    switch (level) {
        case RiskCategory::CRITICAL:
            return Recommendation::BLOCK;
        case RiskCategory::HIGH:
            return (fraud_score >= kChallengeScore || escalated) ? Recommendation::CHALLENGE
                                                                 : Recommendation::REVIEW;
        case RiskCategory::MEDIUM:
            return Recommendation::REVIEW;
        case RiskCategory::LOW:
        case RiskCategory::UNKNOWN:
            break;
    }
    return Recommendation::APPROVE;
}
