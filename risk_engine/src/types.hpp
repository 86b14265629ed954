#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

enum class RiskCategory { UNKNOWN, LOW, MEDIUM, HIGH, CRITICAL };
enum class AlertStatus { NEW, REVIEWED, DISMISSED, CONFIRMED };
enum class Recommendation { APPROVE, REVIEW, CHALLENGE, BLOCK };
enum class PriorityLevel { NORMAL, HIGH };

std::string to_string(RiskCategory category);
std::string to_string(AlertStatus status);
std::string to_string(Recommendation recommendation);
std::string to_string(PriorityLevel priority);

RiskCategory risk_category_from_string(const std::string& value);
AlertStatus alert_status_from_string(const std::string& value);

// Persistent per-customer aggregate
struct RiskProfile {
    std::string id;
    std::string customer_id;
    int current_score = 0;
    RiskCategory category = RiskCategory::UNKNOWN;
    std::optional<TimePoint> last_assessed_at;
    TimePoint created_at;
    long version = 0;  // 0 = never persisted
};

// One per assessment, never mutated
struct RiskScore {
    std::string id;
    std::string assessment_id;
    std::string profile_id;
    int score = 0;
    RiskCategory category = RiskCategory::UNKNOWN;
    int confidence = 0;
    TimePoint assessment_date;
};

struct RiskFactor {
    std::string name;
    double score = 0.0;   // 0..1
    double weight = 0.0;
    std::string description;
    std::string data_source;
    std::string profile_id;
    TimePoint calculated_at;

    nlohmann::json to_json() const;
};

struct FraudAlert {
    std::string id;
    std::string transaction_id;
    std::string customer_id;
    std::string reason;
    int risk_score_ref = 0;
    AlertStatus status = AlertStatus::NEW;
    TimePoint timestamp;
};

// Historical transaction as supplied with an assessment request
struct TransactionRecord {
    std::string id;
    double amount = 0.0;
    std::string currency;
    TimePoint timestamp;
    std::string category;
    std::string merchant;
    std::string payment_method;

    static TransactionRecord from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Every field is optional; absent values are scored as neutral
struct ExternalRiskFactors {
    std::optional<double> credit_score;
    std::optional<int> watchlist_matches;
    std::optional<std::string> sanctions_check;
    std::optional<double> device_risk_score;
    std::optional<std::string> identity_verification_status;

    bool empty() const;
    static ExternalRiskFactors from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct ExplainabilityConfig {
    int depth = 3;  // number of factors echoed back, strongest contributions first
    bool customer_facing = false;
    bool regulator_facing = false;
};

// Single transaction submitted for fraud scoring
struct FraudScoringRequest {
    std::string transaction_id;
    std::string customer_id;
    std::optional<double> amount;
    std::string currency;
    TimePoint timestamp;
    std::string merchant_info;
    std::optional<std::string> ip_address;
    std::optional<std::string> device_fingerprint;
    ExternalRiskFactors external_risk;

    static FraudScoringRequest from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct FraudScoreResult {
    std::string transaction_id;
    int fraud_score = 0;
    RiskCategory risk_level = RiskCategory::LOW;
    Recommendation recommendation = Recommendation::APPROVE;
    double confidence_score = 0.0;  // 0..1
    std::vector<std::string> reasons;
    bool requires_manual_review = false;
    bool alert_raised = false;

    nlohmann::json to_json() const;
};

struct AssessmentRequest {
    std::string customer_id;
    std::vector<TransactionRecord> transaction_history;
    ExternalRiskFactors external_risk_factors;
    std::map<std::string, double> market_data;
    TimePoint request_timestamp;
    ExplainabilityConfig explainability;
    std::optional<FraudScoringRequest> transaction;
    std::string correlation_id;

    static AssessmentRequest from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct AssessmentResponse {
    std::string assessment_id;
    std::string customer_id;
    int risk_score = 0;
    RiskCategory risk_category = RiskCategory::UNKNOWN;
    double confidence_interval = 0.0;
    std::vector<std::string> mitigation_recommendations;
    TimePoint assessment_timestamp;
    bool is_high_risk = false;
    bool requires_manual_review = false;

    std::vector<RiskFactor> risk_factors;
    std::optional<int> fraud_score;
    std::optional<Recommendation> fraud_recommendation;
    bool fallback_applied = false;

    nlohmann::json to_json() const;
};

// Published once per completed assessment
struct AssessmentEvent {
    std::string event_id;
    TimePoint timestamp;
    std::string customer_id;
    std::string correlation_id;
    PriorityLevel priority_level = PriorityLevel::NORMAL;
    nlohmann::json request_echo;
    nlohmann::json metadata;

    nlohmann::json to_json() const;
};

// Published by the fraud scorer whenever an alert is raised
struct FraudDetectionEvent {
    std::string event_id;
    std::string correlation_id;
    TimePoint timestamp;
    std::string transaction_id;
    std::string customer_id;
    int fraud_score = 0;
    RiskCategory risk_level = RiskCategory::LOW;
    Recommendation recommendation = Recommendation::APPROVE;

    nlohmann::json to_json() const;
};

// Inbound request/reply envelopes on the command streams
struct CommandRequest {
    std::string cmd;
    std::string corr_id;
    nlohmann::json payload;

    static CommandRequest from_json(const nlohmann::json& j);
};

struct CommandReply {
    std::string corr_id;
    bool ok = false;
    std::string error_type;
    std::string message;
    nlohmann::json data;
    TimePoint timestamp;

    nlohmann::json to_json() const;
};
