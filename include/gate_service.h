#pragma once

/**
 * @file gate_service.h
 * @brief Transport-facing gate screening service
 */

#include "bridge/events.h"
#include "config.h"
#include "errors.h"
#include "graph/conversation_graph.h"
#include "session/session_state.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gate_sentry {

class ContactDirectory;
class EmployeeRegistry;
class NluService;
class Notifier;
class StateBridge;
template<typename T> class BoundedQueue;

namespace vision {
class FrameSource;
class ImageClassifier;
class VisionPipeline;
}

/**
 * @brief Collaborators the service would otherwise build from config
 *
 * Any member left null is created by initialize().
 */
struct GateDependencies {
    std::shared_ptr<ContactDirectory> contacts;
    std::shared_ptr<EmployeeRegistry> employees;
    std::shared_ptr<NluService> nlu;
    std::shared_ptr<vision::ImageClassifier> classifier;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<vision::FrameSource> frame_source;
};

/// Receives events for the transport (greetings, no-face prompts, escalations)
using EventSink = std::function<void(const GateEvent&)>;

/**
 * @brief Gate screening service
 *
 * Owns the session store, the conversation graph, the vision pipeline and
 * the state bridge. Turns run on a snapshot of the session and are
 * committed back afterwards; the event loop applies bridge updates and
 * forwards events between turns.
 */
class GateService {
public:
    explicit GateService(const Config& config);
    GateService(const Config& config, GateDependencies deps);
    ~GateService();

    GateService(const GateService&) = delete;
    GateService& operator=(const GateService&) = delete;

    /**
     * @brief Load directories and build every component not injected
     * @return false if a required data file cannot be loaded
     */
    bool initialize();

    /**
     * @brief Open a session bound to a door / camera
     * @param camera_id Empty selects the configured camera
     * @return New session id
     */
    Result<std::string> start_session(const std::string& camera_id = "");

    /**
     * @brief Run one conversation turn
     *
     * SessionNotFound for unknown ids; InvalidState if a turn is already
     * running for the session or the session was reset while this one ran.
     */
    Result<TurnResult> send_message(const std::string& session_id, const std::string& text);

    Result<SessionState> get_session(const std::string& session_id) const;

    /// Profile, decision and vision state as JSON
    Result<nlohmann::json> profile_snapshot(const std::string& session_id) const;

    /**
     * @brief Queue a base64 image for vision analysis
     * @return Frame id; ParseError for malformed base64
     */
    Result<uint64_t> upload_image(const std::string& session_id, const std::string& base64_image);

    /// Remove the session with its debounce window and threat log
    Result<void> end_session(const std::string& session_id);

    /// {"status": "ok", "active_sessions": N, "sessions": M}
    nlohmann::json health() const;

    Result<std::vector<nlohmann::json>> threat_logs(const std::string& session_id) const;

    void set_event_sink(EventSink sink);

    /**
     * @brief One event-loop cycle: apply bridge updates, then handle events
     * @return Number of bridge updates and events handled
     */
    size_t process_events_once();

    /**
     * @brief Start vision threads and run the event loop until shutdown()
     * @return Exit code
     */
    int run();

    /// Thread-safe; afterwards new sessions, turns and uploads fail with InvalidState
    void shutdown();

    /// For tests and manual frame injection
    BoundedQueue<Frame>& frame_queue();
    vision::VisionPipeline& vision_pipeline();
    StateBridge& bridge();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace gate_sentry
