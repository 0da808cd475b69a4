#include "session/session_state.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

const char* decision_name(Decision decision) {
    switch (decision) {
        case Decision::None: return "none";
        case Decision::AllowRequest: return "allow_request";
        case Decision::CallSecurity: return "call_security";
        case Decision::DenyRequest: return "deny_request";
    }
    return "none";
}

std::optional<Decision> parse_decision(const std::string& name) {
    std::string n = utils::lower_copy(utils::trim_copy(name));
    if (n == "allow_request") return Decision::AllowRequest;
    if (n == "call_security") return Decision::CallSecurity;
    if (n == "deny_request") return Decision::DenyRequest;
    return std::nullopt;
}

const char* threat_level_name(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::Low: return "low";
        case ThreatLevel::Medium: return "medium";
        case ThreatLevel::High: return "high";
    }
    return "low";
}

ThreatLevel parse_threat_level(const std::string& name) {
    std::string n = utils::lower_copy(utils::trim_copy(name));
    if (n == "high") return ThreatLevel::High;
    if (n == "medium") return ThreatLevel::Medium;
    return ThreatLevel::Low;
}

json VisionSchema::to_json() const {
    return json{
        {"face_detected", face_detected},
        {"angry_face", angry_face},
        {"dangerous_object", dangerous_object},
        {"threat_level", threat_level_name(threat_level)},
        {"details", details}
    };
}

VisionSchema VisionSchema::from_json(const json& j) {
    VisionSchema v;
    if (!j.is_object()) return v;
    auto flag = [&j](const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_boolean() && it->get<bool>();
    };
    v.face_detected = flag("face_detected");
    v.angry_face = flag("angry_face");
    v.dangerous_object = flag("dangerous_object");
    auto level = j.find("threat_level");
    if (level != j.end() && level->is_string()) {
        v.threat_level = parse_threat_level(level->get<std::string>());
    }
    auto details = j.find("details");
    if (details != j.end() && details->is_string()) {
        v.details = details->get<std::string>();
    }
    return v;
}

SessionState SessionState::create(const std::string& session_id,
                                  const std::string& preamble,
                                  bool session_active) {
    SessionState s;
    s.session_id = session_id;
    s.messages.push_back(Message::system(preamble));
    s.session_active = session_active;
    return s;
}

size_t SessionState::human_message_count() const {
    size_t n = 0;
    for (const auto& m : messages) {
        if (m.role == MessageRole::Human) ++n;
    }
    return n;
}

std::string SessionState::preamble() const {
    if (!messages.empty() && messages.front().role == MessageRole::System) {
        return messages.front().content;
    }
    return "";
}

void SessionState::reset_conversation() {
    std::vector<Message> kept;
    if (!messages.empty() && messages.front().role == MessageRole::System) {
        kept.push_back(messages.front());
    }
    messages = std::move(kept);
    visitor_profile.reset();
    decision = Decision::None;
    decision_confidence = 0.0;
    decision_reasoning.clear();
    vision_schema.reset();
    user_input.clear();
    invalid_input = false;
}

json SessionState::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["profile"] = visitor_profile.to_json();
    j["decision"] = decision_name(decision);
    j["decision_confidence"] = decision_confidence;
    j["decision_reasoning"] = decision_reasoning;
    j["vision_schema"] = vision_schema ? vision_schema->to_json() : json(nullptr);
    j["session_active"] = session_active;
    j["camera_id"] = camera_id;
    j["message_count"] = messages.size();
    return j;
}

std::string format_transcript(const std::vector<Message>& messages, size_t from) {
    std::string out;
    for (size_t i = from; i < messages.size(); ++i) {
        const Message& m = messages[i];
        switch (m.role) {
            case MessageRole::System: out += "system: "; break;
            case MessageRole::Human:  out += "human: "; break;
            case MessageRole::Agent:  out += "ai: "; break;
        }
        out += m.content;
        out += '\n';
    }
    return out;
}

std::string format_recent_transcript(const std::vector<Message>& messages, size_t count) {
    size_t from = messages.size() > count ? messages.size() - count : 0;
    return format_transcript(messages, from);
}

} // namespace gate_sentry
