#include "bridge/state_bridge.h"
#include "core/constants.h"
#include "logger.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace gate_sentry {

const char* event_type_name(GateEvent::Type type) {
    switch (type) {
        case GateEvent::Type::AgentMessage: return "agent_message";
        case GateEvent::Type::NoFaceDetected: return "no_face_detected";
        case GateEvent::Type::Escalation: return "escalation";
    }
    return "unknown";
}

StateBridge::StateBridge(SessionStore& store, BoundedQueue<GateEvent>& events, const BridgeConfig& config)
    : store_(store),
      events_(events),
      config_(config),
      requests_(config.request_queue_capacity, "bridge requests") {}

void StateBridge::submit(StateUpdateRequest request) {
    requests_.push(std::move(request));
}

Result<void> StateBridge::apply(const StateUpdateRequest& request) {
    std::vector<GateEvent> emitted;
    const SessionFieldUpdate& fields = request.fields;

    auto result = store_.modify(request.session_id, [&](SessionState& state) {
        if (fields.session_active && *fields.session_active != state.session_active) {
            GateEvent event;
            event.type = GateEvent::Type::AgentMessage;
            event.session_id = state.session_id;

            if (*fields.session_active) {
                event.message = config_.greeting;
                state.messages.push_back(Message::agent(config_.greeting));
                LOG_BRIDGE("Session " + state.session_id + " activated");
            } else {
                event.message = config_.farewell;
                state.reset_conversation();
                state.epoch++;
                LOG_BRIDGE("Session " + state.session_id + " deactivated, conversation reset");
            }
            emitted.push_back(std::move(event));
        }

        const uint64_t revision = ++state.bridge_revision;
        if (fields.session_active) {
            state.session_active = *fields.session_active;
            state.bridge_writes.session_active = revision;
        }
        if (fields.vision_schema) {
            state.vision_schema = *fields.vision_schema;
            state.bridge_writes.vision_schema = revision;
        }
        if (fields.authenticated) {
            state.visitor_profile.authenticated = *fields.authenticated;
            state.bridge_writes.authenticated = revision;
        }
        if (fields.camera_id) {
            state.camera_id = *fields.camera_id;
            state.bridge_writes.camera_id = revision;
        }
    });

    if (!result) {
        return result;
    }
    for (auto& event : emitted) {
        events_.push(std::move(event));
    }
    return Result<void>();
}

size_t StateBridge::drain_once() {
    std::vector<StateUpdateRequest> batch = requests_.drain(config_.max_batch);
    size_t applied = 0;

    for (auto& request : batch) {
        std::string failure;
        try {
            auto result = apply(request);
            if (result) {
                applied++;
                continue;
            }
            if (result.error().type == ErrorType::SessionNotFound) {
                LOG_BRIDGE("Dropping update for unknown session " + request.session_id);
                continue;
            }
            failure = result.error().message;
        } catch (const std::exception& e) {
            failure = e.what();
        }
        retry_or_drop(std::move(request), failure);
    }
    return applied;
}

void StateBridge::retry_or_drop(StateUpdateRequest request, const std::string& failure) {
    request.attempts++;
    if (request.attempts >= constants::bridge::MAX_ATTEMPTS) {
        Logger::error("[Bridge] Giving up on update for " + request.session_id + " after " +
                      std::to_string(request.attempts) + " attempts: " + failure);
        return;
    }
    Logger::warn("[Bridge] Update for " + request.session_id + " failed (attempt " +
                 std::to_string(request.attempts) + "), retrying: " + failure);
    const std::string session_id = request.session_id;
    if (!requests_.push_front(std::move(request))) {
        Logger::warn("[Bridge] Request queue full, retry for " + session_id + " dropped");
    }
}

} // namespace gate_sentry
