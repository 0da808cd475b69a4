#include "graph/decision_engine.h"
#include "core/constants.h"
#include "logger.h"
#include "nlu/nlu_service.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

namespace {

Error decision_parse_error(const std::string& message) {
    return make_error(ErrorType::DecisionParseFailure, message);
}

DecisionOutcome fail_closed(const std::string& reason) {
    DecisionOutcome out;
    out.decision = Decision::DenyRequest;
    out.confidence = 0.0;
    out.reasoning = reason;
    out.message = "I cannot process your request at this time. Please contact reception for assistance.";
    return out;
}

} // namespace

const char* decision_message(Decision decision) {
    switch (decision) {
        case Decision::AllowRequest:
            return "Access granted. Welcome! Please proceed to the main entrance.";
        case Decision::CallSecurity:
            return "Please wait here. Security has been notified and will assist you shortly.";
        case Decision::DenyRequest:
            return "Access denied. Please contact the appropriate department to arrange your visit.";
        case Decision::None:
            break;
    }
    return "I cannot process your request at this time. Please contact reception for assistance.";
}

Result<ClassifiedDecision> parse_decision_reply(const std::string& reply) {
    auto object = utils::extract_json_object(reply);
    if (!object) {
        return decision_parse_error("No JSON object in reply");
    }

    json j;
    try {
        j = json::parse(*object);
    } catch (const json::exception& e) {
        return decision_parse_error(std::string("Invalid JSON: ") + e.what());
    }

    if (!j.contains("decision") || !j["decision"].is_string()) {
        return decision_parse_error("Missing decision");
    }
    auto decision = parse_decision(j["decision"].get<std::string>());
    if (!decision) {
        return decision_parse_error("Unknown decision: " + j["decision"].get<std::string>());
    }
    if (!j.contains("confidence") || !j["confidence"].is_number()) {
        return decision_parse_error("Missing confidence");
    }
    double confidence = j["confidence"].get<double>();
    if (confidence < 0.0 || confidence > 1.0) {
        return decision_parse_error("Confidence out of range: " + std::to_string(confidence));
    }

    ClassifiedDecision out;
    out.decision = *decision;
    out.confidence = confidence;
    if (j.contains("reasoning") && j["reasoning"].is_string()) {
        out.reasoning = j["reasoning"].get<std::string>();
    }
    return out;
}

DecisionOutcome DecisionEngine::decide(const SessionState& state) {
    if (state.vision_schema && state.vision_schema->is_high_threat()) {
        DecisionOutcome out;
        out.decision = Decision::CallSecurity;
        out.confidence = 1.0;
        out.reasoning = "High threat reported by camera: " + state.vision_schema->details;
        out.message = decision_message(Decision::CallSecurity);
        return out;
    }

    if (state.visitor_profile.authenticated) {
        return decide_authenticated(state);
    }

    auto reply = nlu_.classify_decision(state.visitor_profile,
        format_recent_transcript(state.messages, constants::dialog::DECISION_CONTEXT));
    if (!reply) {
        Logger::warn("[Decision] Classifier call failed: " + reply.error().message);
        return fail_closed("Decision classifier unavailable");
    }

    auto parsed = parse_decision_reply(reply.value());
    if (!parsed) {
        Logger::warn("[Decision] " + parsed.error().to_string() + " (reply: " + reply.value() + ")");
        return fail_closed("Decision classifier reply could not be parsed");
    }

    DecisionOutcome out;
    out.decision = parsed.value().decision;
    out.confidence = parsed.value().confidence;
    out.reasoning = parsed.value().reasoning;
    out.message = decision_message(out.decision);
    return out;
}

DecisionOutcome DecisionEngine::decide_authenticated(const SessionState& state) const {
    const FieldValue& name = state.visitor_profile.name;
    DecisionOutcome out;
    out.confidence = 1.0;

    std::optional<Employee> employee;
    if (name.has_value()) {
        employee = employees_.find(name.value());
    }
    if (employee && employees_.is_authorized(employee->name, state.camera_id)) {
        out.decision = Decision::AllowRequest;
        out.reasoning = "Authenticated employee authorized for door " + state.camera_id;
        out.message = employee->greeting;
        return out;
    }

    // Authenticated but not cleared for this door
    out.decision = Decision::DenyRequest;
    out.reasoning = employee ? "Employee not authorized for door " + state.camera_id
                             : "Authenticated person not in employee registry";
    out.message = "Sorry, you are not authorized to enter through this door. "
                  "Please use an entrance you have access to or contact security.";
    return out;
}

} // namespace gate_sentry
