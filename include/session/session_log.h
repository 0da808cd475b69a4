#pragma once

/**
 * @file session_log.h
 * @brief Bounded per-session record of vision assessments on disk
 */

#include "errors.h"
#include "session/session_state.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gate_sentry {

/**
 * @brief Append-only threat log, one JSON file per session
 *
 * Each file (`<dir>/<session_id>.json`) holds an array of
 * `{"timestamp_ms", "vision"}` entries, trimmed to the last
 * max_entries. Files are rewritten on every append.
 */
class SessionLog {
public:
    SessionLog(const std::string& dir, size_t max_entries);
    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    Result<void> append(const std::string& session_id, const VisionSchema& vision);

    /// Stored entries, oldest first; empty for a session with no log
    std::vector<nlohmann::json> entries(const std::string& session_id) const;

    /// Remove the session's entries (inactivity or end of session)
    Result<void> clear(const std::string& session_id);

    const std::string& dir() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace gate_sentry
