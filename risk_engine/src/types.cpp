#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"

using json = nlohmann::json;

namespace {
    std::string optional_string(const json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return "";
        }
        if (!j.at(key).is_string()) {
            throw ValidationError(key, "must be a string");
        }
        return j.at(key).get<std::string>();
    }

    std::optional<double> optional_number(const json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::nullopt;
        }
        if (!j.at(key).is_number()) {
            throw ValidationError(key, "must be a number");
        }
        return j.at(key).get<double>();
    }

    TimePoint optional_timestamp(const json& j, const char* key, TimePoint default_value) {
        std::string value = optional_string(j, key);
        if (value.empty()) {
            return default_value;
        }
        try {
            return util::parse_iso8601(value);
        } catch (const std::exception& e) {
            throw ValidationError(key, e.what());
        }
    }
}

std::string to_string(RiskCategory category) {
    switch (category) {
        case RiskCategory::UNKNOWN: return "UNKNOWN";
        case RiskCategory::LOW: return "LOW";
        case RiskCategory::MEDIUM: return "MEDIUM";
        case RiskCategory::HIGH: return "HIGH";
        case RiskCategory::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string to_string(AlertStatus status) {
    switch (status) {
        case AlertStatus::NEW: return "NEW";
        case AlertStatus::REVIEWED: return "REVIEWED";
        case AlertStatus::DISMISSED: return "DISMISSED";
        case AlertStatus::CONFIRMED: return "CONFIRMED";
    }
    return "NEW";
}

std::string to_string(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::APPROVE: return "APPROVE";
        case Recommendation::REVIEW: return "REVIEW";
        case Recommendation::CHALLENGE: return "CHALLENGE";
        case Recommendation::BLOCK: return "BLOCK";
    }
    return "REVIEW";
}

std::string to_string(PriorityLevel priority) {
    return priority == PriorityLevel::HIGH ? "HIGH" : "NORMAL";
}

RiskCategory risk_category_from_string(const std::string& value) {
    if (value == "LOW") return RiskCategory::LOW;
    if (value == "MEDIUM") return RiskCategory::MEDIUM;
    if (value == "HIGH") return RiskCategory::HIGH;
    if (value == "CRITICAL") return RiskCategory::CRITICAL;
    return RiskCategory::UNKNOWN;
}

AlertStatus alert_status_from_string(const std::string& value) {
    if (value == "REVIEWED") return AlertStatus::REVIEWED;
    if (value == "DISMISSED") return AlertStatus::DISMISSED;
    if (value == "CONFIRMED") return AlertStatus::CONFIRMED;
    return AlertStatus::NEW;
}

json RiskFactor::to_json() const {
    json j;
    j["name"] = name;
    j["score"] = score;
    j["weight"] = weight;
    j["description"] = description;
    j["data_source"] = data_source;
    return j;
}

TransactionRecord TransactionRecord::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("transaction_history", "entries must be objects");
    }

    TransactionRecord record;
    record.id = optional_string(j, "id");
    auto amount = optional_number(j, "amount");
    if (!amount) {
        throw ValidationError("transaction_history.amount", "is required");
    }
    record.amount = *amount;
    record.currency = optional_string(j, "currency");
    record.timestamp = optional_timestamp(j, "timestamp", TimePoint{});
    record.category = optional_string(j, "category");
    record.merchant = optional_string(j, "merchant");
    record.payment_method = optional_string(j, "payment_method");
    return record;
}

json TransactionRecord::to_json() const {
    json j;
    j["id"] = id;
    j["amount"] = amount;
    j["currency"] = currency;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["category"] = category;
    j["merchant"] = merchant;
    j["payment_method"] = payment_method;
    return j;
}

bool ExternalRiskFactors::empty() const {
    return !credit_score && !watchlist_matches && !sanctions_check &&
           !device_risk_score && !identity_verification_status;
}

ExternalRiskFactors ExternalRiskFactors::from_json(const json& j) {
    ExternalRiskFactors factors;
    if (!j.is_object()) {
        return factors;
    }

    factors.credit_score = optional_number(j, "credit_score");
    if (auto matches = optional_number(j, "watchlist_matches")) {
        factors.watchlist_matches = static_cast<int>(*matches);
    }
    if (j.contains("sanctions_check") && j.at("sanctions_check").is_string()) {
        factors.sanctions_check = j.at("sanctions_check").get<std::string>();
    }
    factors.device_risk_score = optional_number(j, "device_risk_score");
    if (j.contains("identity_verification_status") && j.at("identity_verification_status").is_string()) {
        factors.identity_verification_status = j.at("identity_verification_status").get<std::string>();
    }
    return factors;
}

json ExternalRiskFactors::to_json() const {
    json j = json::object();
    if (credit_score) j["credit_score"] = *credit_score;
    if (watchlist_matches) j["watchlist_matches"] = *watchlist_matches;
    if (sanctions_check) j["sanctions_check"] = *sanctions_check;
    if (device_risk_score) j["device_risk_score"] = *device_risk_score;
    if (identity_verification_status) j["identity_verification_status"] = *identity_verification_status;
    return j;
}

FraudScoringRequest FraudScoringRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("transaction", "must be an object");
    }

    FraudScoringRequest request;
    request.transaction_id = optional_string(j, "transaction_id");
    request.customer_id = optional_string(j, "customer_id");
    request.amount = optional_number(j, "amount");
    request.currency = optional_string(j, "currency");
    request.timestamp = optional_timestamp(j, "timestamp", std::chrono::system_clock::now());
    request.merchant_info = optional_string(j, "merchant_info");

    std::string ip = optional_string(j, "ip_address");
    if (!ip.empty()) {
        request.ip_address = ip;
    }
    std::string device = optional_string(j, "device_fingerprint");
    if (!device.empty()) {
        request.device_fingerprint = device;
    }

    if (j.contains("external_risk_factors")) {
        request.external_risk = ExternalRiskFactors::from_json(j.at("external_risk_factors"));
    }
    return request;
}

json FraudScoringRequest::to_json() const {
    json j;
    j["transaction_id"] = transaction_id;
    j["customer_id"] = customer_id;
    j["amount"] = amount ? json(*amount) : json(nullptr);
    j["currency"] = currency;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["merchant_info"] = merchant_info;
    j["ip_address"] = ip_address ? json(*ip_address) : json(nullptr);
    j["device_fingerprint"] = device_fingerprint ? json(*device_fingerprint) : json(nullptr);
    j["external_risk_factors"] = external_risk.to_json();
    return j;
}

json FraudScoreResult::to_json() const {
    json j;
    j["transaction_id"] = transaction_id;
    j["fraud_score"] = fraud_score;
    j["risk_level"] = to_string(risk_level);
    j["recommendation"] = to_string(recommendation);
    j["confidence_score"] = confidence_score;
    j["reasons"] = reasons;
    j["requires_manual_review"] = requires_manual_review;
    j["alert_raised"] = alert_raised;
    return j;
}

AssessmentRequest AssessmentRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("request", "must be a JSON object");
    }
    if (!j.contains("customer_id") || !j.at("customer_id").is_string()) {
        throw ValidationError("customer_id", "is required");
    }

    AssessmentRequest request;
    request.customer_id = j.at("customer_id").get<std::string>();

    if (j.contains("transaction_history") && !j.at("transaction_history").is_null()) {
        if (!j.at("transaction_history").is_array()) {
            throw ValidationError("transaction_history", "must be an array");
        }
        for (const auto& entry : j.at("transaction_history")) {
            request.transaction_history.push_back(TransactionRecord::from_json(entry));
        }
    }

    if (j.contains("external_risk_factors")) {
        request.external_risk_factors = ExternalRiskFactors::from_json(j.at("external_risk_factors"));
    }

    if (j.contains("market_data") && j.at("market_data").is_object()) {
        for (const auto& [key, value] : j.at("market_data").items()) {
            if (value.is_number()) {
                request.market_data[key] = value.get<double>();
            }
        }
    }

    request.request_timestamp = optional_timestamp(j, "request_timestamp", std::chrono::system_clock::now());

    if (j.contains("explainability_config") && j.at("explainability_config").is_object()) {
        const auto& cfg = j.at("explainability_config");
        request.explainability.depth = cfg.value("depth", request.explainability.depth);
        request.explainability.customer_facing = cfg.value("customer_facing", false);
        request.explainability.regulator_facing = cfg.value("regulator_facing", false);
    }

    if (j.contains("transaction") && !j.at("transaction").is_null()) {
        request.transaction = FraudScoringRequest::from_json(j.at("transaction"));
        if (request.transaction->customer_id.empty()) {
            request.transaction->customer_id = request.customer_id;
        }
    }

    request.correlation_id = optional_string(j, "correlation_id");
    return request;
}

json AssessmentRequest::to_json() const {
    json j;
    j["customer_id"] = customer_id;

    j["transaction_history"] = json::array();
    for (const auto& record : transaction_history) {
        j["transaction_history"].push_back(record.to_json());
    }

    j["external_risk_factors"] = external_risk_factors.to_json();
    j["market_data"] = market_data;
    j["request_timestamp"] = util::format_iso8601(request_timestamp);
    j["explainability_config"] = {
        {"depth", explainability.depth},
        {"customer_facing", explainability.customer_facing},
        {"regulator_facing", explainability.regulator_facing}
    };
    if (transaction) {
        j["transaction"] = transaction->to_json();
    }
    if (!correlation_id.empty()) {
        j["correlation_id"] = correlation_id;
    }
    return j;
}

json AssessmentResponse::to_json() const {
    json j;
    j["assessment_id"] = assessment_id;
    j["customer_id"] = customer_id;
    j["risk_score"] = risk_score;
    j["risk_category"] = to_string(risk_category);
    j["confidence_interval"] = confidence_interval;
    j["mitigation_recommendations"] = mitigation_recommendations;
    j["assessment_timestamp"] = util::format_iso8601(assessment_timestamp);
    j["is_high_risk"] = is_high_risk;
    j["requires_manual_review"] = requires_manual_review;

    j["risk_factors"] = json::array();
    for (const auto& factor : risk_factors) {
        j["risk_factors"].push_back(factor.to_json());
    }

    j["fraud_score"] = fraud_score ? json(*fraud_score) : json(nullptr);
    j["fraud_recommendation"] = fraud_recommendation ? json(to_string(*fraud_recommendation)) : json(nullptr);
    j["fallback_applied"] = fallback_applied;
    return j;
}

json AssessmentEvent::to_json() const {
    json j;
    j["event_id"] = event_id;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["customer_id"] = customer_id;
    j["correlation_id"] = correlation_id;
    j["priority_level"] = to_string(priority_level);
    j["request_echo"] = request_echo;
    j["metadata"] = metadata;
    return j;
}

json FraudDetectionEvent::to_json() const {
    json j;
    j["event_id"] = event_id;
    j["correlation_id"] = correlation_id;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["transaction_id"] = transaction_id;
    j["customer_id"] = customer_id;
    j["fraud_score"] = fraud_score;
    j["risk_level"] = to_string(risk_level);
    j["recommendation"] = to_string(recommendation);
    return j;
}

CommandRequest CommandRequest::from_json(const json& j) {
    CommandRequest request;
    request.cmd = j.value("cmd", "assess");
    request.corr_id = j.value("corr_id", "");
    request.payload = j.contains("payload") ? j.at("payload") : json::object();
    return request;
}

json CommandReply::to_json() const {
    json j;
    j["corr_id"] = corr_id;
    j["ok"] = ok;
    if (!ok) {
        j["error_type"] = error_type;
        j["message"] = message;
    }
    j["data"] = data;
    j["timestamp"] = util::format_iso8601(timestamp);
    return j;
}
