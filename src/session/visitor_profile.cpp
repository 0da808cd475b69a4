#include "session/visitor_profile.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

const char* field_key(ProfileField field) {
    switch (field) {
        case ProfileField::Name: return "name";
        case ProfileField::Purpose: return "purpose";
        case ProfileField::ContactPerson: return "contact_person";
        case ProfileField::ThreatLevel: return "threat_level";
        case ProfileField::Affiliation: return "affiliation";
    }
    return "unknown";
}

const char* field_label(ProfileField field) {
    switch (field) {
        case ProfileField::Name: return "name";
        case ProfileField::Purpose: return "purpose";
        case ProfileField::ContactPerson: return "contact person";
        case ProfileField::ThreatLevel: return "threat level";
        case ProfileField::Affiliation: return "affiliation";
    }
    return "unknown";
}

const FieldValue& VisitorProfile::get(ProfileField field) const {
    return const_cast<VisitorProfile*>(this)->slot(field);
}

FieldValue& VisitorProfile::slot(ProfileField field) {
    switch (field) {
        case ProfileField::Name: return name;
        case ProfileField::Purpose: return purpose;
        case ProfileField::ContactPerson: return contact_person;
        case ProfileField::ThreatLevel: return threat_level;
        case ProfileField::Affiliation: return affiliation;
    }
    return name;
}

bool VisitorProfile::set_if_absent(ProfileField field, const std::string& value) {
    FieldValue& s = slot(field);
    if (s.has_value() || value.empty()) {
        return false;
    }
    s = FieldValue::of(value);
    return true;
}

void VisitorProfile::mark_unknown(ProfileField field) {
    FieldValue& s = slot(field);
    if (!s.has_value()) {
        s = FieldValue::unknown();
    }
}

bool VisitorProfile::is_complete() const {
    for (ProfileField f : kProfileFieldOrder) {
        if (!get(f).has_value()) return false;
    }
    return true;
}

bool VisitorProfile::first_missing(ProfileField& out) const {
    for (ProfileField f : kProfileFieldOrder) {
        if (!get(f).has_value()) {
            out = f;
            return true;
        }
    }
    return false;
}

json VisitorProfile::to_json() const {
    json j;
    for (ProfileField f : kProfileFieldOrder) {
        const FieldValue& v = get(f);
        switch (v.state()) {
            case FieldValue::State::Unset: j[field_key(f)] = nullptr; break;
            case FieldValue::State::Unknown: j[field_key(f)] = "unknown"; break;
            case FieldValue::State::Value: j[field_key(f)] = v.value(); break;
        }
    }
    j["id_verified"] = id_verified;
    j["authenticated"] = authenticated;
    return j;
}

} // namespace gate_sentry
