#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the gate_sentry screening agent
 *
 * Timing aliases, conversation messages and visual frames shared by
 * the orchestrator, the vision pipeline and the state bridge.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace gate_sentry {

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Get milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock milliseconds since the Unix epoch (for persisted records)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Conversation Types
// =============================================================================

/**
 * @brief Role of a message in the session transcript
 */
enum class MessageRole {
    System,
    Human,
    Agent
};

/**
 * @brief Role name as sent to chat models ("system", "user", "assistant")
 */
inline const char* role_to_chat_role(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::Human:  return "user";
        case MessageRole::Agent:  return "assistant";
    }
    return "user";
}

/**
 * @brief Role-tagged transcript entry
 */
struct Message {
    MessageRole role = MessageRole::Human;
    std::string content;

    static Message system(const std::string& content) { return {MessageRole::System, content}; }
    static Message human(const std::string& content) { return {MessageRole::Human, content}; }
    static Message agent(const std::string& content) { return {MessageRole::Agent, content}; }

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }
};

// =============================================================================
// Vision Types
// =============================================================================

/**
 * @brief One captured or uploaded camera frame
 */
struct Frame {
    uint64_t id = 0;
    std::string session_id;
    std::string camera_id;
    std::string image;          ///< Raw encoded image bytes (JPEG/PNG)
    TimePoint captured_at{};
};

} // namespace gate_sentry
