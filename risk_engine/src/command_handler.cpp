#include "command_handler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    CommandReply error_reply(const CommandRequest& request, const std::string& type, const std::string& message) {
        CommandReply reply;
        reply.corr_id = request.corr_id;
        reply.ok = false;
        reply.error_type = type;
        reply.message = message;
        reply.data = json::object();
        reply.timestamp = std::chrono::system_clock::now();
        return reply;
    }

    json profile_to_json(const RiskProfile& profile) {
        json j;
        j["id"] = profile.id;
        j["customer_id"] = profile.customer_id;
        j["current_score"] = profile.current_score;
        j["category"] = to_string(profile.category);
        j["last_assessed_at"] = profile.last_assessed_at
            ? json(util::format_iso8601(*profile.last_assessed_at)) : json(nullptr);
        j["created_at"] = util::format_iso8601(profile.created_at);
        j["version"] = profile.version;
        return j;
    }
}

CommandHandler::CommandHandler(RiskAssessmentEngine& engine) : engine_(engine) {}

CommandReply CommandHandler::handle(const CommandRequest& request) {
    try {
        CommandReply reply;
        reply.corr_id = request.corr_id;

        if (request.cmd == "assess") {
            reply.data = handle_assess(request);
        } else if (request.cmd == "score") {
            reply.data = handle_score(request);
        } else if (request.cmd == "profile") {
            reply.data = handle_profile(request);
        } else {
            spdlog::warn("Unknown command '{}' (corr_id {})", request.cmd, request.corr_id);
            return error_reply(request, "unknown_command", "unsupported command: " + request.cmd);
        }

        reply.ok = true;
        reply.timestamp = std::chrono::system_clock::now();
        return reply;
    } catch (const ValidationError& e) {
        spdlog::warn("Rejected {} request {}: {}", request.cmd, request.corr_id, e.what());
        auto reply = error_reply(request, "validation_error", e.what());
        reply.data["field"] = e.field();
        return reply;
    } catch (const RiskAssessmentException& e) {
        auto reply = error_reply(request, "assessment_error", e.what());
        reply.data["retryable"] = e.is_retryable();
        return reply;
    } catch (const json::exception& e) {
        return error_reply(request, "bad_request", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure handling {} request {}: {}", request.cmd, request.corr_id, e.what());
        return error_reply(request, "internal_error", e.what());
    }
}

json CommandHandler::handle_assess(const CommandRequest& request) {
    auto assessment = AssessmentRequest::from_json(request.payload);
    if (assessment.correlation_id.empty()) {
        assessment.correlation_id = request.corr_id;
    }
    return engine_.assess(assessment).to_json();
}

json CommandHandler::handle_score(const CommandRequest& request) {
    auto transaction = FraudScoringRequest::from_json(request.payload);
    return engine_.score_transaction(transaction, request.corr_id).to_json();
}

json CommandHandler::handle_profile(const CommandRequest& request) {
    std::string customer_id = request.payload.value("customer_id", "");
    auto profile = engine_.find_profile(customer_id);
    return profile ? profile_to_json(*profile) : json(nullptr);
}
