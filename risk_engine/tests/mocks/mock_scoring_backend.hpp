#pragma once

#include "scoring_backend.hpp"
#include <gmock/gmock.h>

class MockScoringBackend : public FraudScoringBackend {
public:
    MOCK_METHOD(ScoringResult, score, (const ScoringContext& context), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};
