#pragma once

#include <exception>
#include <stdexcept>
#include <string>

// Base of every error the engine raises on purpose
class RiskEngineError : public std::runtime_error {
public:
    explicit RiskEngineError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or missing required input. Raised before any side effect.
class ValidationError : public RiskEngineError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : RiskEngineError("Validation error on '" + field + "': " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class PersistenceError : public RiskEngineError {
public:
    explicit PersistenceError(const std::string& message)
        : RiskEngineError("Persistence error: " + message) {}
};

// Optimistic version check failed; the whole assessment can be retried
class ConcurrencyConflictError : public PersistenceError {
public:
    ConcurrencyConflictError(const std::string& customer_id, long expected_version)
        : PersistenceError("profile for customer " + customer_id +
                           " changed concurrently (expected version " +
                           std::to_string(expected_version) + ")"),
          customer_id_(customer_id) {}

    const std::string& customer_id() const { return customer_id_; }

private:
    std::string customer_id_;
};

// Fatal scoring backend failure (bad request, corrupt response)
class FraudScoringError : public RiskEngineError {
public:
    FraudScoringError(const std::string& transaction_id, const std::string& message)
        : RiskEngineError("Fraud scoring failed for transaction " + transaction_id + ": " + message),
          transaction_id_(transaction_id) {}

    const std::string& transaction_id() const { return transaction_id_; }

private:
    std::string transaction_id_;
};

class PublishError : public RiskEngineError {
public:
    explicit PublishError(const std::string& message)
        : RiskEngineError("Publish error: " + message) {}
};

// What callers of the engine see when an assessment could not be completed
class RiskAssessmentException : public RiskEngineError {
public:
    RiskAssessmentException(const std::string& customer_id, const std::string& message,
                            std::exception_ptr cause, bool retryable = false)
        : RiskEngineError("Risk assessment failed for customer " + customer_id + ": " + message),
          customer_id_(customer_id), cause_(std::move(cause)), retryable_(retryable) {}

    const std::string& customer_id() const { return customer_id_; }
    std::exception_ptr cause() const { return cause_; }
    bool is_retryable() const { return retryable_; }

    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    std::string customer_id_;
    std::exception_ptr cause_;
    bool retryable_;
};
