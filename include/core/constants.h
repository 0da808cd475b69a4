#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for every tunable live here; config.json overrides them.
 */

#include <cstddef>

namespace gate_sentry {
namespace constants {

// =============================================================================
// Dialog Constants
// =============================================================================

namespace dialog {
    /// Human messages allowed before history is compacted
    constexpr size_t MAX_HUMAN_MESSAGES = 10;

    /// Compaction never runs below this many messages
    constexpr size_t COMPACT_MIN_MESSAGES = 8;

    /// Messages kept verbatim by the shorten strategy
    constexpr size_t SHORTEN_KEEP_LAST = 5;

    /// Messages kept verbatim by the summarize strategy
    constexpr size_t SUMMARIZE_KEEP_LAST = 4;

    /// Messages shown to the new-visitor detector
    constexpr size_t VISITOR_CHANGE_CONTEXT = 6;

    /// Messages shown to the decision classifier
    constexpr size_t DECISION_CONTEXT = 10;

    /// Extracted values are cut to this many words
    constexpr size_t MAX_FIELD_WORDS = 3;

    /// Upper bound on node executions in one turn
    constexpr int MAX_TURN_STEPS = 32;
}

// =============================================================================
// Vision Constants
// =============================================================================

namespace vision {
    /// Face-presence debounce window length
    constexpr size_t FACE_WINDOW_SIZE = 4;

    /// Per-session minimum gap between escalation events (ms)
    constexpr int ESCALATION_COOLDOWN_MS = 10000;

    /// Frame queue capacity (drop-oldest)
    constexpr size_t FRAME_QUEUE_CAPACITY = 10;

    /// Capture producer period (ms)
    constexpr int CAPTURE_INTERVAL_MS = 2000;

    /// Consumer poll interval when the queue is empty (ms)
    constexpr int CONSUMER_POLL_MS = 100;

    /// Persisted vision records per session
    constexpr size_t SESSION_LOG_MAX_ENTRIES = 50;
}

// =============================================================================
// Bridge / Event Loop Constants
// =============================================================================

namespace bridge {
    /// Update request queue capacity (drop-oldest)
    constexpr size_t REQUEST_QUEUE_CAPACITY = 50;

    /// Requests applied per drain cycle
    constexpr size_t MAX_BATCH = 10;

    /// Attempts before a failing request is dropped
    constexpr int MAX_ATTEMPTS = 3;

    /// Outbound event queue capacity (drop-oldest)
    constexpr size_t EVENT_QUEUE_CAPACITY = 20;

    /// Events handled per event-loop cycle
    constexpr size_t MAX_EVENTS_PER_CYCLE = 5;

    /// Event loop sleep after a busy / idle cycle (ms)
    constexpr int BUSY_SLEEP_MS = 50;
    constexpr int IDLE_SLEEP_MS = 100;
}

// =============================================================================
// Network Constants
// =============================================================================

namespace network {
    /// Model request timeout (ms)
    constexpr int LLM_TIMEOUT_MS = 60000;

    /// Connect timeout for HTTP and SMTP (ms)
    constexpr int CONNECT_TIMEOUT_MS = 3000;

    /// SMTP send timeout (ms)
    constexpr int SMTP_TIMEOUT_MS = 15000;
}

} // namespace constants
} // namespace gate_sentry
