#pragma once

#include "config.hpp"
#include "scoring_backend.hpp"

// Remote fraud model over HTTP. Transport failures, timeouts and 5xx answers are
// Unavailable; 4xx answers and malformed or out-of-range scores are Fatal.
class HttpScoringBackend : public FraudScoringBackend {
public:
    explicit HttpScoringBackend(const Config& config);

    ScoringResult score(const ScoringContext& context) override;
    std::string name() const override { return "http"; }

    // Maps a model answer to a result; separate from transport for reuse
    static ScoringResult parse_response(long status_code, const std::string& body);

private:
    const Config& config_;
    std::string endpoint_;
};
