#pragma once

/**
 * Scripted collaborators for deterministic tests (no Ollama, no SMTP).
 */

#include "notify/notifier.h"
#include "nlu/nlu_service.h"
#include "utils.h"
#include "vision/image_classifier.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gate_sentry {
namespace testing {

/**
 * NLU double: field answers are set per field, "-1" when not set.
 * A human line containing one of new_visitor_markers is reported as a new visitor.
 */
class FakeNlu : public NluService {
public:
    std::map<ProfileField, std::string> answers;
    std::set<std::string> unrelated_inputs;
    std::vector<std::string> new_visitor_markers;
    std::string decision_reply = R"({"decision": "allow_request", "confidence": 0.9, "reasoning": "complete profile"})";
    std::string summary = "Visitor gave partial details.";

    bool fail_classify = false;
    bool fail_decision = false;
    bool fail_summary = false;
    bool fail_extraction = false;

    int classify_calls = 0;
    int change_calls = 0;
    int decision_calls = 0;
    std::map<ProfileField, int> extract_calls;

    Result<InputRelevance> classify_input(const std::string& user_input) override {
        classify_calls++;
        if (fail_classify) return make_network_error("validation model offline");
        return unrelated_inputs.count(user_input) ? InputRelevance::Unrelated : InputRelevance::Valid;
    }

    Result<VisitorChange> detect_visitor_change(const std::vector<Message>& recent) override {
        change_calls++;
        for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
            if (it->role != MessageRole::Human) continue;
            for (const auto& marker : new_visitor_markers) {
                if (it->content.find(marker) != std::string::npos) return VisitorChange::New;
            }
            break;
        }
        return VisitorChange::Same;
    }

    Result<std::string> extract_field(ProfileField field, const std::string& transcript) override {
        (void)transcript;
        extract_calls[field]++;
        if (fail_extraction) return make_timeout_error();
        auto it = answers.find(field);
        return it == answers.end() ? std::string("-1") : it->second;
    }

    Result<std::string> summarize(const std::string& transcript) override {
        (void)transcript;
        if (fail_summary) return make_network_error("summary model offline");
        return summary;
    }

    Result<std::string> classify_decision(const VisitorProfile& profile,
                                          const std::string& recent_transcript) override {
        (void)profile;
        (void)recent_transcript;
        decision_calls++;
        if (fail_decision) return make_timeout_error();
        return decision_reply;
    }
};

/**
 * Image classifier double: returns `reply` for every frame, records what it saw.
 */
class FakeClassifier : public vision::ImageClassifier {
public:
    std::string reply = R"({"face_detected": true, "angry_face": false, "dangerous_object": false, "threat_level": "low", "details": "visitor"})";
    bool fail = false;
    std::vector<std::string> seen;

    Result<std::string> classify(const std::string& image) override {
        seen.push_back(image);
        if (fail) return make_network_error("vision model offline");
        return reply;
    }

    void set_face(bool face) {
        reply = std::string(R"({"face_detected": )") + (face ? "true" : "false") +
                R"(, "angry_face": false, "dangerous_object": false, "threat_level": "low", "details": "frame"})";
    }

    void set_threat() {
        reply = R"({"face_detected": true, "angry_face": true, "dangerous_object": true, "threat_level": "high", "details": "knife visible"})";
    }
};

class RecordingNotifier : public Notifier {
public:
    struct Sent {
        std::string contact;
        std::string subject;
        std::string body;
    };

    bool succeed = true;
    std::vector<Sent> sent;

    NotifyResult notify(const std::string& contact_name,
                        const std::string& subject,
                        const std::string& body) override {
        sent.push_back({contact_name, subject, body});
        NotifyResult result;
        result.success = succeed;
        result.message = succeed ? "sent" : "mail server unreachable";
        return result;
    }
};

} // namespace testing
} // namespace gate_sentry
