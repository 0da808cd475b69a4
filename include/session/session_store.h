#pragma once

/**
 * @file session_store.h
 * @brief Mutex-guarded map of live sessions
 */

#include "errors.h"
#include "session/session_state.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gate_sentry {

/**
 * @brief Owner of every SessionState
 *
 * Turns run on copies taken with snapshot() and are written back with
 * commit_turn(). The bridge mutates in place through modify().
 */
class SessionStore {
public:
    SessionStore() = default;
    virtual ~SessionStore() = default;
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Fails with InvalidState if the id already exists
    Result<void> create(SessionState state);

    bool contains(const std::string& session_id) const;

    /// Copy of the current state; SessionNotFound for unknown ids
    Result<SessionState> snapshot(const std::string& session_id) const;

    /**
     * @brief Write back a turn that ran on a snapshot
     * @param before Snapshot the turn started from
     * @param after State at the end of the turn
     *
     * If the stored epoch differs from before.epoch the session was reset
     * while the turn ran, and the turn is dropped (InvalidState). A bridge-owned
     * field keeps its stored value only if the bridge wrote that field after
     * the snapshot; otherwise the turn's value (including a reset) is kept.
     */
    Result<void> commit_turn(const SessionState& before, const SessionState& after);

    /// Apply `fn` to the stored state under the store lock
    virtual Result<void> modify(const std::string& session_id,
                                const std::function<void(SessionState&)>& fn);

    /// @return true if a session was removed
    bool erase(const std::string& session_id);

    size_t size() const;
    std::vector<std::string> session_ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SessionState> sessions_;
};

} // namespace gate_sentry
