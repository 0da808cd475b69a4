#pragma once

/**
 * @file visitor_profile.h
 * @brief Visitor identity fields gathered during intake
 */

#include <array>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gate_sentry {

/**
 * @brief Three-valued profile slot: never attempted, attempted and failed, or known
 */
class FieldValue {
public:
    enum class State {
        Unset,    ///< Extraction never attempted
        Unknown,  ///< Attempted, no usable value
        Value     ///< Holds a value
    };

    FieldValue() = default;

    static FieldValue unset() { return FieldValue(); }
    static FieldValue unknown() { return FieldValue(State::Unknown, ""); }
    static FieldValue of(const std::string& value) { return FieldValue(State::Value, value); }

    State state() const { return state_; }
    bool has_value() const { return state_ == State::Value; }
    bool is_unset() const { return state_ == State::Unset; }
    bool is_unknown() const { return state_ == State::Unknown; }

    /// Empty unless has_value()
    const std::string& value() const { return value_; }

    bool operator==(const FieldValue& other) const {
        return state_ == other.state_ && value_ == other.value_;
    }
    bool operator!=(const FieldValue& other) const { return !(*this == other); }

private:
    FieldValue(State state, std::string value) : state_(state), value_(std::move(value)) {}

    State state_ = State::Unset;
    std::string value_;
};

/**
 * @brief Tracked profile fields, in question priority order
 */
enum class ProfileField {
    Name,
    Purpose,
    ContactPerson,
    ThreatLevel,
    Affiliation
};

constexpr std::array<ProfileField, 5> kProfileFieldOrder = {
    ProfileField::Name,
    ProfileField::Purpose,
    ProfileField::ContactPerson,
    ProfileField::ThreatLevel,
    ProfileField::Affiliation
};

/// Snake-case key ("contact_person")
const char* field_key(ProfileField field);

/// Spoken label ("contact person")
const char* field_label(ProfileField field);

/**
 * @brief Everything known about the visitor at the gate
 *
 * Invariant: a field holding a value is never overwritten until reset().
 */
struct VisitorProfile {
    FieldValue name;
    FieldValue purpose;
    FieldValue contact_person;
    FieldValue threat_level;
    FieldValue affiliation;
    bool id_verified = false;
    bool authenticated = false;

    const FieldValue& get(ProfileField field) const;

    /**
     * @brief Store a value unless the field already holds one
     * @return true if stored
     */
    bool set_if_absent(ProfileField field, const std::string& value);

    /**
     * @brief Record a failed extraction (Unset -> Unknown); values are kept
     */
    void mark_unknown(ProfileField field);

    /// True iff all five fields hold a value
    bool is_complete() const;

    /// First field without a value in priority order; false if complete
    bool first_missing(ProfileField& out) const;

    void reset() { *this = VisitorProfile(); }

    nlohmann::json to_json() const;

private:
    FieldValue& slot(ProfileField field);
};

} // namespace gate_sentry
