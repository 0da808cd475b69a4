#pragma once

/**
 * @file events.h
 * @brief Messages crossing from the vision and bridge contexts to the event loop
 */

#include "session/session_state.h"
#include <optional>
#include <string>

namespace gate_sentry {

/**
 * @brief Outbound notification for a session's transport channel
 */
struct GateEvent {
    enum class Type {
        AgentMessage,     ///< Greeting / farewell on an activation edge
        NoFaceDetected,   ///< Window went all-false
        Escalation        ///< High threat with a dangerous object
    };

    Type type = Type::AgentMessage;
    std::string session_id;
    std::string message;
};

/// "agent_message", "no_face_detected", "escalation"
const char* event_type_name(GateEvent::Type type);

/**
 * @brief Typed field set carried by a bridge update
 *
 * Unset members are left untouched.
 */
struct SessionFieldUpdate {
    std::optional<bool> session_active;
    std::optional<VisionSchema> vision_schema;
    std::optional<bool> authenticated;
    std::optional<std::string> camera_id;

    bool empty() const {
        return !session_active && !vision_schema && !authenticated && !camera_id;
    }
};

/**
 * @brief {action: update, session_id, fields}
 */
struct StateUpdateRequest {
    std::string session_id;
    SessionFieldUpdate fields;
    int attempts = 0;
};

} // namespace gate_sentry
