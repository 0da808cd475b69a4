#include "session/session_store.h"
#include "logger.h"

namespace gate_sentry {

Result<void> SessionStore::create(SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(state.session_id)) {
        return make_error(ErrorType::InvalidState, "Session already exists: " + state.session_id);
    }
    std::string id = state.session_id;
    sessions_.emplace(id, std::move(state));
    LOG_SESSION("Created session " + id);
    return Result<void>();
}

bool SessionStore::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

Result<SessionState> SessionStore::snapshot(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return make_session_not_found(session_id);
    }
    return it->second;
}

Result<void> SessionStore::commit_turn(const SessionState& before, const SessionState& after) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(before.session_id);
    if (it == sessions_.end()) {
        return make_session_not_found(before.session_id);
    }
    SessionState& stored = it->second;

    if (stored.epoch != before.epoch) {
        Logger::warn("[Session] Dropping turn for " + before.session_id +
                     ": session was reset while the turn ran");
        return make_error(ErrorType::InvalidState, "Session reset during turn");
    }

    // Only fields the bridge wrote after the turn's snapshot win over the turn
    const uint64_t base = before.bridge_revision;
    const SessionState::BridgeWrites writes = stored.bridge_writes;
    const uint64_t revision = stored.bridge_revision;
    const bool session_active = stored.session_active;
    const std::string camera_id = stored.camera_id;
    const std::optional<VisionSchema> vision_schema = stored.vision_schema;
    const bool authenticated = stored.visitor_profile.authenticated;

    stored = after;
    stored.epoch = before.epoch;
    stored.bridge_revision = revision;
    stored.bridge_writes = writes;

    if (writes.session_active > base) stored.session_active = session_active;
    if (writes.camera_id > base) stored.camera_id = camera_id;
    if (writes.vision_schema > base) stored.vision_schema = vision_schema;
    if (writes.authenticated > base) stored.visitor_profile.authenticated = authenticated;

    if (revision != base) {
        LOG_SESSION("Merged bridge updates of " + before.session_id + " written during turn");
    }
    return Result<void>();
}

Result<void> SessionStore::modify(const std::string& session_id,
                                  const std::function<void(SessionState&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return make_session_not_found(session_id);
    }
    fn(it->second);
    return Result<void>();
}

bool SessionStore::erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        ids.push_back(kv.first);
    }
    return ids;
}

} // namespace gate_sentry
