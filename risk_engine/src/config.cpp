#include "config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    bool get_env_bool(const char* name, bool default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        std::string v(value);
        if (v == "1" || v == "true" || v == "yes" || v == "on") {
            return true;
        }
        if (v == "0" || v == "false" || v == "no" || v == "off") {
            return false;
        }
        spdlog::warn("Invalid boolean value for {}: {}", name, value);
        return default_value;
    }
}

ThresholdTable Config::thresholds() const {
    ThresholdTable table;
    table.medium = threshold_medium;
    table.high = threshold_high;
    table.critical = threshold_critical;
    return table;
}

void Config::load_from_env() {
    // Redis configuration
    redis_url = get_env("REDIS_URL", redis_url);
    stream_requests = get_env("STREAM_REQUESTS", stream_requests);
    stream_replies = get_env("STREAM_REPLIES", stream_replies);
    consumer_group = get_env("CONSUMER_GROUP", consumer_group);
    topic_assessment_events = get_env("TOPIC_ASSESSMENT_EVENTS", topic_assessment_events);
    topic_fraud_events = get_env("TOPIC_FRAUD_EVENTS", topic_fraud_events);

    // PostgreSQL configuration
    pg_dsn = get_env("PG_DSN", pg_dsn);
    pg_pool_size = get_env_int("PG_POOL_SIZE", pg_pool_size);

    // Backends
    store_backend = get_env("STORE_BACKEND", store_backend);
    window_backend = get_env("WINDOW_BACKEND", window_backend);
    scoring_backend = get_env("SCORING_BACKEND", scoring_backend);
    scoring_url = get_env("SCORING_URL", scoring_url);
    scoring_timeout_ms = get_env_int("SCORING_TIMEOUT_MS", scoring_timeout_ms);

    // Scoring
    threshold_medium = get_env_int("THRESHOLD_MEDIUM", threshold_medium);
    threshold_high = get_env_int("THRESHOLD_HIGH", threshold_high);
    threshold_critical = get_env_int("THRESHOLD_CRITICAL", threshold_critical);
    fraud_blend_weight = get_env_double("FRAUD_BLEND_WEIGHT", fraud_blend_weight);
    fallback_fraud_score = get_env_int("FALLBACK_FRAUD_SCORE", fallback_fraud_score);
    parallel_analysis = get_env_bool("PARALLEL_ANALYSIS", parallel_analysis);

    // Velocity
    velocity_window_size = get_env_int("VELOCITY_WINDOW_SIZE", velocity_window_size);
    velocity_window_minutes = get_env_int("VELOCITY_WINDOW_MINUTES", velocity_window_minutes);
    surge_ratio = get_env_double("VELOCITY_SURGE_RATIO", surge_ratio);
    frequency_spike_count = get_env_int("VELOCITY_FREQUENCY_SPIKE_COUNT", frequency_spike_count);
    frequency_window_minutes = get_env_int("VELOCITY_FREQUENCY_WINDOW_MINUTES", frequency_window_minutes);
    window_ttl_hours = get_env_int("VELOCITY_WINDOW_TTL_HOURS", window_ttl_hours);

    // Publishing
    publish_queue_capacity = get_env_int("PUBLISH_QUEUE_CAPACITY", publish_queue_capacity);
    publish_timeout_ms = get_env_int("PUBLISH_TIMEOUT_MS", publish_timeout_ms);

    // Service configuration
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);
    health_host = get_env("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);
}

void Config::validate() const {
    if (!thresholds().is_valid()) {
        throw std::invalid_argument("Thresholds must satisfy 0 < medium < high < critical <= 1000");
    }

    if (fraud_blend_weight < 0.0 || fraud_blend_weight > 1.0) {
        throw std::invalid_argument("FRAUD_BLEND_WEIGHT must be within [0, 1]");
    }

    if (fallback_fraud_score < 0 || fallback_fraud_score > ThresholdTable::kMaxScore) {
        throw std::invalid_argument("FALLBACK_FRAUD_SCORE must be within [0, 1000]");
    }

    if (velocity_window_size <= 0 || velocity_window_minutes <= 0 || frequency_window_minutes <= 0) {
        throw std::invalid_argument("Velocity window settings must be positive");
    }

    if (surge_ratio <= 1.0) {
        throw std::invalid_argument("VELOCITY_SURGE_RATIO must be greater than 1");
    }

    if (publish_queue_capacity <= 0 || publish_timeout_ms < 0) {
        throw std::invalid_argument("Publish queue capacity must be positive and timeout non-negative");
    }

    if (store_backend != "postgres" && store_backend != "memory") {
        throw std::invalid_argument("STORE_BACKEND must be 'postgres' or 'memory'");
    }

    if (window_backend != "redis" && window_backend != "memory") {
        throw std::invalid_argument("WINDOW_BACKEND must be 'redis' or 'memory'");
    }

    if (scoring_backend != "heuristic" && scoring_backend != "http") {
        throw std::invalid_argument("SCORING_BACKEND must be 'heuristic' or 'http'");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw std::invalid_argument("HEALTH_PORT must be between 1 and 65535");
    }
}
