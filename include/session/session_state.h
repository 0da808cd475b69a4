#pragma once

/**
 * @file session_state.h
 * @brief Per-session screening state shared by the orchestrator and the bridge
 */

#include "core/types.h"
#include "session/visitor_profile.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace gate_sentry {

/**
 * @brief Access decision
 */
enum class Decision {
    None,
    AllowRequest,
    CallSecurity,
    DenyRequest
};

/// Wire name ("allow_request", ...); "none" for Decision::None
const char* decision_name(Decision decision);

/// Parse a wire name; nullopt for anything else (including "none")
std::optional<Decision> parse_decision(const std::string& name);

/**
 * @brief Threat level reported by image classification
 */
enum class ThreatLevel {
    Low,
    Medium,
    High
};

const char* threat_level_name(ThreatLevel level);

/// Case-insensitive; unrecognized input maps to Low
ThreatLevel parse_threat_level(const std::string& name);

/**
 * @brief Normalized result of one image classification
 *
 * Defaults are the safe values used when classification fails.
 */
struct VisionSchema {
    bool face_detected = false;
    bool angry_face = false;
    bool dangerous_object = false;
    ThreatLevel threat_level = ThreatLevel::Low;
    std::string details;

    bool is_high_threat() const { return threat_level == ThreatLevel::High; }

    nlohmann::json to_json() const;

    /**
     * @brief Build from classifier JSON; missing or mistyped fields fall back to defaults
     */
    static VisionSchema from_json(const nlohmann::json& j);
};

/**
 * @brief Full conversational and vision state of one gate session
 */
struct SessionState {
    std::string session_id;
    std::vector<Message> messages;
    VisitorProfile visitor_profile;
    Decision decision = Decision::None;
    double decision_confidence = 0.0;
    std::string decision_reasoning;
    std::optional<VisionSchema> vision_schema;
    std::string user_input;
    bool invalid_input = false;
    bool session_active = false;

    /// Door / camera the session is bound to (may be empty)
    std::string camera_id;

    /// Bumped by every bridge-initiated reset; stale turns are dropped on commit
    uint64_t epoch = 0;

    /// Bumped by every bridge update
    uint64_t bridge_revision = 0;

    /// bridge_revision at which each bridge-owned field was last written
    struct BridgeWrites {
        uint64_t session_active = 0;
        uint64_t vision_schema = 0;
        uint64_t authenticated = 0;
        uint64_t camera_id = 0;
    };
    BridgeWrites bridge_writes;

    /**
     * @brief New session holding only the system preamble
     */
    static SessionState create(const std::string& session_id,
                               const std::string& preamble,
                               bool session_active);

    /// Number of human-role messages in the transcript
    size_t human_message_count() const;

    /// Content of the leading system message, or empty
    std::string preamble() const;

    /**
     * @brief Clear profile and decision, truncate history to the preamble
     *
     * Keeps session_id, camera_id, session_active and counters.
     */
    void reset_conversation();

    nlohmann::json to_json() const;
};

/**
 * @brief Render messages[from, end) as "role: content" lines
 */
std::string format_transcript(const std::vector<Message>& messages, size_t from = 0);

/**
 * @brief Render only the last `count` messages
 */
std::string format_recent_transcript(const std::vector<Message>& messages, size_t count);

} // namespace gate_sentry
