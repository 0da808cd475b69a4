#include "nlu/ollama_nlu_service.h"
#include "llm_client.h"
#include "logger.h"
#include "session/session_state.h"
#include "utils.h"

namespace gate_sentry {

namespace {

const char* field_description(ProfileField field) {
    switch (field) {
        case ProfileField::Name:
            return "The visitor's full name. Examples: 'John Smith', 'Maria Garcia', '-1'";
        case ProfileField::Purpose:
            return "Why they are visiting. Examples: 'meeting', 'delivery', 'interview', 'maintenance', '-1'";
        case ProfileField::ContactPerson:
            return "The person inside the company they came to see. Examples: 'David Smith', 'Alice Kimble', '-1'";
        case ProfileField::ThreatLevel:
            return "Security risk judged from items carried, behaviour or stated concerns. One of: 'low', 'medium', 'high', '-1'";
        case ProfileField::Affiliation:
            return "Company or organization they represent. Examples: 'Google', 'FedEx', 'independent contractor', '-1'";
    }
    return "";
}

std::string extraction_prompt(ProfileField field, const std::string& transcript,
                              const std::string& known_contacts) {
    std::string key = field_key(field);
    std::string prompt =
        "You extract a single value from a security gate conversation.\n\n"
        "FIELD: " + key + " = " + field_description(field) + "\n";
    if (field == ProfileField::ContactPerson && !known_contacts.empty()) {
        prompt += "Known contacts: " + known_contacts + "\n";
    }
    prompt +=
        "\nRULES:\n"
        "- Reply with ONLY the " + key + " value, no sentences or explanations\n"
        "- If the conversation does not clearly state it, reply exactly: -1\n"
        "- At most 3 words\n\n"
        "Conversation:\n" + transcript + "\n"
        "Extract " + key + ":";
    return prompt;
}

std::string profile_summary(const VisitorProfile& profile) {
    std::string out;
    for (ProfileField f : kProfileFieldOrder) {
        const FieldValue& v = profile.get(f);
        out += std::string("- ") + field_key(f) + ": " + (v.has_value() ? v.value() : "unknown") + "\n";
    }
    out += std::string("- id_verified: ") + (profile.id_verified ? "true" : "false") + "\n";
    return out;
}

const char* kDecisionSchema = R"({
  "type": "object",
  "properties": {
    "decision": {"type": "string", "enum": ["allow_request", "call_security", "deny_request"]},
    "confidence": {"type": "number"},
    "reasoning": {"type": "string"}
  },
  "required": ["decision", "confidence", "reasoning"]
})";

} // namespace

class OllamaNluService::Impl {
public:
    Impl(const ModelsConfig& models, const ContactDirectory& contacts)
        : main_(models.main),
          validation_(models.validation),
          session_(models.session),
          summary_(models.summary),
          decision_(models.decision),
          known_contacts_(utils::join(contacts.names(), ", ")) {}

    LLMClient main_;
    LLMClient validation_;
    LLMClient session_;
    LLMClient summary_;
    LLMClient decision_;
    std::string known_contacts_;
};

OllamaNluService::OllamaNluService(const ModelsConfig& models, const ContactDirectory& contacts)
    : pimpl_(std::make_unique<Impl>(models, contacts)) {}

OllamaNluService::~OllamaNluService() = default;

InputRelevance OllamaNluService::interpret_relevance(const std::string& answer) {
    std::string a = utils::lower_copy(answer);
    if (a.find("unrelated") != std::string::npos && a.find("valid") == std::string::npos) {
        return InputRelevance::Unrelated;
    }
    return InputRelevance::Valid;
}

VisitorChange OllamaNluService::interpret_visitor_change(const std::string& answer) {
    std::string a = utils::lower_copy(answer);
    if (a.find("new") != std::string::npos && a.find("same") == std::string::npos) {
        return VisitorChange::New;
    }
    return VisitorChange::Same;
}

Result<InputRelevance> OllamaNluService::classify_input(const std::string& user_input) {
    std::string prompt =
        "You screen messages typed at a security gate kiosk.\n"
        "VALID: names, companies, visit purposes, answers to security questions, "
        "questions about the visit, descriptions of belongings or mood, small talk.\n"
        "UNRELATED: gibberish, random characters, insults, spam, topics with no bearing on a visit.\n\n"
        "Reply with one word, \"valid\" or \"unrelated\".\n\n"
        "Message: \"" + user_input + "\"\n"
        "Answer:";
    auto reply = pimpl_->validation_.complete(prompt);
    if (!reply) return reply.error();
    return interpret_relevance(reply.value());
}

Result<VisitorChange> OllamaNluService::detect_visitor_change(const std::vector<Message>& recent) {
    std::string latest;
    for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
        if (it->role == MessageRole::Human) {
            latest = it->content;
            break;
        }
    }
    std::string prompt =
        "Decide whether the latest message at a security gate comes from a NEW visitor "
        "or the SAME visitor continuing. Unless it is obvious, answer SAME.\n"
        "NEW: introduces a different name than before, a fresh greeting after a finished "
        "exchange, or says they are someone else.\n\n"
        "Conversation:\n" + format_transcript(recent) + "\n"
        "Latest message: " + latest + "\n\n"
        "Reply with one word, \"new\" or \"same\".\n"
        "Answer:";
    auto reply = pimpl_->session_.complete(prompt);
    if (!reply) return reply.error();
    return interpret_visitor_change(reply.value());
}

Result<std::string> OllamaNluService::extract_field(ProfileField field, const std::string& transcript) {
    return pimpl_->main_.complete(extraction_prompt(field, transcript, pimpl_->known_contacts_));
}

Result<std::string> OllamaNluService::summarize(const std::string& transcript) {
    std::string prompt =
        "Summarize this conversation between a security gate assistant and a visitor. "
        "Keep only the visitor's identity details (name, purpose, affiliation, contact), "
        "anything security relevant, and context needed to continue. Be brief.\n\n"
        "Conversation:\n" + transcript + "\n"
        "Summary:";
    return pimpl_->summary_.complete(prompt);
}

Result<std::string> OllamaNluService::classify_decision(const VisitorProfile& profile,
                                                        const std::string& recent_transcript) {
    ChatRequest request;
    request.messages.push_back(Message::human(
        "You are the decision system of a security gate. Choose one action:\n"
        "- allow_request: visitor is identified, has a legitimate purpose and a known contact, low risk\n"
        "- call_security: behaviour, items or statements suggest a risk that needs a guard\n"
        "- deny_request: purpose or identity is not acceptable\n\n"
        "Visitor profile:\n" + profile_summary(profile) + "\n"
        "Recent conversation:\n" + recent_transcript + "\n"
        "Reply with JSON: {\"decision\": ..., \"confidence\": 0.0-1.0, \"reasoning\": ...}"));
    request.format_json = kDecisionSchema;
    return pimpl_->decision_.chat(request);
}

} // namespace gate_sentry
