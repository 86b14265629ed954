#pragma once

#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

struct ScoringContext {
    FraudScoringRequest request;
    int recent_transaction_count = 0;
};

// Tagged result of a backend call. Unavailable is recoverable, Fatal is not.
struct ScoringResult {
    enum class Status { Success, Unavailable, Fatal };

    Status status = Status::Success;
    double base_score = 0.0;           // 0..1000, meaningful on Success
    std::vector<std::string> reasons;  // backend-specific context lines
    std::string error;

    bool ok() const { return status == Status::Success; }

    static ScoringResult success(double score, std::vector<std::string> reasons = {}) {
        ScoringResult r;
        r.status = Status::Success;
        r.base_score = score;
        r.reasons = std::move(reasons);
        return r;
    }

    static ScoringResult unavailable(std::string reason) {
        ScoringResult r;
        r.status = Status::Unavailable;
        r.error = std::move(reason);
        return r;
    }

    static ScoringResult fatal(std::string reason) {
        ScoringResult r;
        r.status = Status::Fatal;
        r.error = std::move(reason);
        return r;
    }
};

std::string to_string(ScoringResult::Status status);

class FraudScoringBackend {
public:
    virtual ~FraudScoringBackend() = default;

    virtual ScoringResult score(const ScoringContext& context) = 0;
    virtual std::string name() const = 0;
};
