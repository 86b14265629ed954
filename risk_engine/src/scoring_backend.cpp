#include "scoring_backend.hpp"

std::string to_string(ScoringResult::Status status) {
    switch (status) {
        case ScoringResult::Status::Success: return "success";
        case ScoringResult::Status::Unavailable: return "unavailable";
        case ScoringResult::Status::Fatal: return "fatal";
    }
    return "unknown";
}
