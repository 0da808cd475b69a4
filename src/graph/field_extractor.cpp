#include "graph/field_extractor.h"
#include "core/constants.h"
#include "logger.h"
#include "nlu/nlu_service.h"
#include "session/session_state.h"
#include "utils.h"

namespace gate_sentry {

namespace {

const char* kSentinel = "-1";

std::string capitalized(const std::string& s) {
    std::string out = s;
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

/// Remove one leading label if present (case-insensitive)
std::string strip_label(const std::string& text, ProfileField field) {
    std::string label = field_label(field);
    std::string key = field_key(field);
    const std::vector<std::string> prefixes = {
        key + ":", label + ":", capitalized(label) + ":",
        "Answer:", "Response:", "Value:", "Result:",
        "The " + label + " is", "Their " + label + " is"
    };
    for (const auto& prefix : prefixes) {
        if (utils::istarts_with(text, prefix)) {
            return utils::trim_copy(text.substr(prefix.size()));
        }
    }
    return text;
}

std::string strip_quotes(const std::string& text) {
    std::string t = text;
    while (t.size() >= 2 && (t.front() == '"' || t.front() == '\'') && t.back() == t.front()) {
        t = utils::trim_copy(t.substr(1, t.size() - 2));
    }
    return t;
}

std::string strip_trailing_punctuation(const std::string& text) {
    std::string t = text;
    while (!t.empty() && (t.back() == '.' || t.back() == ',' || t.back() == '!' || t.back() == ';')) {
        t.pop_back();
    }
    return utils::trim_copy(t);
}

} // namespace

std::optional<std::string> clean_extracted_value(ProfileField field, const std::string& raw) {
    std::string value = utils::strip_think_block(raw);

    // Only the first line is the answer; models sometimes add commentary
    size_t newline = value.find('\n');
    if (newline != std::string::npos) {
        value = utils::trim_copy(value.substr(0, newline));
    }

    value = strip_label(value, field);
    value = strip_quotes(value);
    value = strip_trailing_punctuation(value);

    if (value.empty() || value == kSentinel) {
        return std::nullopt;
    }

    if (field != ProfileField::ContactPerson) {
        auto words = utils::split_words(value);
        if (words.size() > constants::dialog::MAX_FIELD_WORDS) {
            words.erase(words.begin(), words.end() - constants::dialog::MAX_FIELD_WORDS);
            value = utils::join(words, " ");
        }
        if (value == kSentinel) return std::nullopt;
    }
    return value;
}

ExtractionOutcome FieldExtractor::extract(VisitorProfile& profile, const std::vector<Message>& messages) {
    ExtractionOutcome outcome;
    const std::string transcript = format_transcript(messages);

    for (ProfileField field : kProfileFieldOrder) {
        if (profile.get(field).has_value()) {
            continue;
        }

        auto raw = nlu_.extract_field(field, transcript);
        if (!raw) {
            Logger::warn(std::string("[Extract] ") + field_key(field) + " failed: " + raw.error().message);
            profile.mark_unknown(field);
            outcome.failed.push_back(field);
            continue;
        }

        auto cleaned = clean_extracted_value(field, raw.value());
        if (!cleaned) {
            profile.mark_unknown(field);
            outcome.failed.push_back(field);
            continue;
        }

        if (field == ProfileField::ContactPerson) {
            outcome.contact_candidate = *cleaned;
            continue;
        }

        if (profile.set_if_absent(field, *cleaned)) {
            Logger::debug(std::string("[Extract] ") + field_key(field) + " = " + *cleaned);
            outcome.extracted.push_back(field);
        }
    }
    return outcome;
}

bool validate_contact(VisitorProfile& profile, const ContactDirectory& directory,
                      const std::optional<std::string>& candidate) {
    if (!candidate || profile.contact_person.has_value()) {
        return false;
    }

    auto match = directory.match(*candidate);
    if (!match) {
        Logger::info("[Extract] Contact \"" + *candidate + "\" not in directory, discarded");
        profile.mark_unknown(ProfileField::ContactPerson);
        return false;
    }

    profile.set_if_absent(ProfileField::ContactPerson, *match);
    return true;
}

bool check_completeness(VisitorProfile& profile) {
    profile.id_verified = profile.is_complete();
    return profile.id_verified;
}

std::string intake_question(const VisitorProfile& profile, const ContactDirectory& directory,
                            const std::string& fallback) {
    ProfileField missing;
    if (!profile.first_missing(missing)) {
        return fallback;
    }
    switch (missing) {
        case ProfileField::Name:
            return "What is your name?";
        case ProfileField::Purpose:
            return "What is the purpose of your visit today?";
        case ProfileField::ContactPerson:
            if (directory.empty()) return "Who is your contact?";
            return "Who is your contact? (Known contacts include: " + utils::join(directory.names(), ", ") + ")";
        case ProfileField::ThreatLevel:
            return "Are you carrying any restricted items or have any security concerns I should know about?";
        case ProfileField::Affiliation:
            return "What company or organization are you with?";
    }
    return fallback;
}

} // namespace gate_sentry
