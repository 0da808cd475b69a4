#include "gate_service.h"
#include "bridge/state_bridge.h"
#include "core/bounded_queue.h"
#include "directory/contact_directory.h"
#include "directory/employee_registry.h"
#include "logger.h"
#include "nlu/ollama_nlu_service.h"
#include "notify/notifier.h"
#include "notify/smtp_notifier.h"
#include "session/session_log.h"
#include "session/session_store.h"
#include "utils.h"
#include "vision/frame_source.h"
#include "vision/image_classifier.h"
#include "vision/vision_pipeline.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using json = nlohmann::json;

namespace gate_sentry {

class GateService::Impl {
public:
    Impl(const Config& config, GateDependencies deps)
        : config_(config),
          deps_(std::move(deps)),
          events_(config.bridge.event_queue_capacity, "gate events"),
          frames_(config.vision.frame_queue_capacity, "frames") {}

    ~Impl() {
        shutdown();
    }

    bool initialize() {
        if (initialized_) {
            return true;
        }

        if (!deps_.contacts) {
            auto contacts = ContactDirectory::load_from_file(config_.paths.contacts_file);
            if (!contacts) {
                Logger::error("Failed to load contacts: " + contacts.error().to_string());
                return false;
            }
            deps_.contacts = std::make_shared<ContactDirectory>(std::move(contacts.value()));
        }
        Logger::info("Contact directory: " + std::to_string(deps_.contacts->size()) + " contacts");

        if (!deps_.employees) {
            auto employees = EmployeeRegistry::load_from_file(config_.paths.employees_file);
            if (!employees) {
                // Authentication is optional; an empty registry authorizes nobody
                Logger::warn("Employee registry unavailable: " + employees.error().to_string());
                deps_.employees = std::make_shared<EmployeeRegistry>();
            } else {
                deps_.employees = std::make_shared<EmployeeRegistry>(std::move(employees.value()));
            }
        }

        if (!deps_.nlu) {
            deps_.nlu = std::make_shared<OllamaNluService>(config_.models, *deps_.contacts);
        }
        if (!deps_.classifier) {
            deps_.classifier = std::make_shared<vision::OllamaImageClassifier>(config_.models.vision);
        }
        if (!deps_.notifier) {
            if (config_.notify.transport == "smtp") {
                deps_.notifier = std::make_shared<SmtpNotifier>(config_.notify, *deps_.contacts);
            } else {
                deps_.notifier = std::make_shared<LogNotifier>(*deps_.contacts);
            }
            Logger::info("Notification transport: " + config_.notify.transport);
        }
        if (!deps_.frame_source && config_.vision.enabled && !config_.vision.snapshot_dir.empty()) {
            deps_.frame_source = std::make_shared<vision::DirectoryFrameSource>(config_.vision.snapshot_dir);
        }

        graph_ = std::make_unique<ConversationGraph>(config_.dialog, *deps_.nlu, *deps_.contacts,
                                                     *deps_.employees, *deps_.notifier);
        session_log_ = std::make_unique<SessionLog>(config_.paths.session_log_dir,
                                                    config_.vision.session_log_max_entries);
        bridge_ = std::make_unique<StateBridge>(store_, events_, config_.bridge);
        pipeline_ = std::make_unique<vision::VisionPipeline>(config_.vision, *deps_.classifier,
                                                             frames_, *bridge_, events_, *session_log_);
        if (deps_.frame_source) {
            producer_ = std::make_unique<vision::CaptureProducer>(*deps_.frame_source, frames_,
                                                                  config_.vision.camera_id,
                                                                  config_.vision.capture_interval_ms);
        }

        initialized_ = true;
        Logger::info("Gate service initialized (vision " +
                     std::string(config_.vision.enabled ? "enabled" : "disabled") + ")");
        return true;
    }

    Result<std::string> start_session(const std::string& camera_id) {
        if (!initialized_) {
            return make_error(ErrorType::InvalidState, "Service not initialized");
        }
        if (shut_down_) {
            return make_error(ErrorType::InvalidState, "Service is shut down");
        }
        std::string id = utils::random_hex_id(16);
        SessionState state = SessionState::create(id, config_.dialog.system_prompt, !config_.vision.enabled);
        state.camera_id = camera_id.empty() ? config_.vision.camera_id : camera_id;

        auto created = store_.create(std::move(state));
        if (!created) {
            return created.error();
        }
        if (producer_) {
            producer_->bind_session(id);
        }
        return id;
    }

    Result<TurnResult> send_message(const std::string& session_id, const std::string& text) {
        if (!initialized_) {
            return make_error(ErrorType::InvalidState, "Service not initialized");
        }
        if (shut_down_) {
            return make_error(ErrorType::InvalidState, "Service is shut down");
        }
        {
            std::lock_guard<std::mutex> lock(busy_mutex_);
            if (!store_.contains(session_id)) {
                return make_session_not_found(session_id);
            }
            if (!busy_.insert(session_id).second) {
                return make_error(ErrorType::InvalidState, "A turn is already running for " + session_id);
            }
        }
        TurnGuard guard(*this, session_id);

        auto before = store_.snapshot(session_id);
        if (!before) {
            return before.error();
        }
        SessionState after = before.value();
        TurnResult result = graph_->run_turn(after, text);

        auto committed = store_.commit_turn(before.value(), after);
        if (!committed) {
            return committed.error();
        }
        return result;
    }

    Result<SessionState> get_session(const std::string& session_id) const {
        return store_.snapshot(session_id);
    }

    Result<uint64_t> upload_image(const std::string& session_id, const std::string& base64_image) {
        if (shut_down_) {
            return make_error(ErrorType::InvalidState, "Service is shut down");
        }
        if (!store_.contains(session_id)) {
            return make_session_not_found(session_id);
        }
        auto bytes = utils::base64_decode(base64_image);
        if (!bytes || bytes->empty()) {
            return make_parse_error("Image is not valid base64");
        }

        Frame frame;
        frame.id = vision::next_frame_id();
        frame.session_id = session_id;
        frame.image = std::move(*bytes);
        frame.captured_at = Clock::now();
        auto state = store_.snapshot(session_id);
        if (state) {
            frame.camera_id = state.value().camera_id;
        }
        uint64_t id = frame.id;
        frames_.push(std::move(frame));
        LOG_VISION("Queued uploaded frame " + std::to_string(id) + " for session " + session_id);
        return id;
    }

    Result<void> end_session(const std::string& session_id) {
        if (!store_.erase(session_id)) {
            return make_session_not_found(session_id);
        }
        if (pipeline_) {
            pipeline_->forget_session(session_id);
        }
        if (session_log_) {
            auto cleared = session_log_->clear(session_id);
            if (!cleared) {
                Logger::warn("[Session] " + cleared.error().message);
            }
        }
        if (producer_ && producer_->unbind_session(session_id)) {
            LOG_VISION("Camera " + config_.vision.camera_id + " unbound from " + session_id);
        }
        LOG_SESSION("Ended session " + session_id);
        return Result<void>();
    }

    json health() const {
        size_t active = 0;
        for (const auto& id : store_.session_ids()) {
            auto state = store_.snapshot(id);
            if (state && state.value().session_active) active++;
        }
        json j;
        j["status"] = "ok";
        j["active_sessions"] = active;
        j["sessions"] = store_.size();
        return j;
    }

    Result<std::vector<json>> threat_logs(const std::string& session_id) const {
        if (!store_.contains(session_id)) {
            return make_session_not_found(session_id);
        }
        return session_log_->entries(session_id);
    }

    void set_event_sink(EventSink sink) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
    }

    size_t process_events_once() {
        if (!initialized_) return 0;
        size_t handled = bridge_->drain_once();

        std::vector<GateEvent> events = events_.drain(config_.bridge.max_events_per_cycle);
        for (const auto& event : events) {
            handled++;
            if (event.type == GateEvent::Type::Escalation) {
                handle_escalation(event);
            }
            deliver(event);
        }
        return handled;
    }

    int run() {
        if (!initialized_ && !initialize()) {
            return 1;
        }
        running_ = true;
        if (shut_down_) {
            running_ = false;
            return 0;
        }
        if (config_.vision.enabled) {
            pipeline_->start();
            if (producer_) producer_->start();
        }

        Logger::info("=== Gate service running ===");
        while (running_) {
            size_t handled = 0;
            try {
                handled = process_events_once();
            } catch (const std::exception& e) {
                Logger::error(std::string("Event loop cycle failed: ") + e.what());
            }
            int sleep_ms = handled > 0 ? constants::bridge::BUSY_SLEEP_MS : constants::bridge::IDLE_SLEEP_MS;
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
        }
        Logger::info("Gate service stopped");
        return 0;
    }

    void shutdown() {
        shut_down_ = true;
        running_ = false;
        if (producer_) producer_->stop();
        if (pipeline_) pipeline_->stop();
    }

    Config config_;
    GateDependencies deps_;
    SessionStore store_;
    BoundedQueue<GateEvent> events_;
    BoundedQueue<Frame> frames_;
    std::unique_ptr<SessionLog> session_log_;
    std::unique_ptr<StateBridge> bridge_;
    std::unique_ptr<ConversationGraph> graph_;
    std::unique_ptr<vision::VisionPipeline> pipeline_;
    std::unique_ptr<vision::CaptureProducer> producer_;

private:
    /// Releases the per-session busy flag when a turn ends
    class TurnGuard {
    public:
        TurnGuard(Impl& impl, std::string session_id) : impl_(impl), session_id_(std::move(session_id)) {}
        ~TurnGuard() {
            std::lock_guard<std::mutex> lock(impl_.busy_mutex_);
            impl_.busy_.erase(session_id_);
        }
    private:
        Impl& impl_;
        std::string session_id_;
    };

    void handle_escalation(const GateEvent& event) {
        // Apply the pending vision update first so the turn sees the high threat
        bridge_->drain_once();

        auto result = send_message(event.session_id, config_.dialog.escalation_message);
        if (!result) {
            Logger::warn("[Bridge] Escalation turn for " + event.session_id + " not run: " +
                         result.error().message);
            return;
        }
        for (const auto& line : result.value().agent_messages) {
            GateEvent reply;
            reply.type = GateEvent::Type::AgentMessage;
            reply.session_id = event.session_id;
            reply.message = line;
            deliver(reply);
        }
    }

    void deliver(const GateEvent& event) {
        EventSink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        if (sink) {
            sink(event);
        } else {
            Logger::debug(std::string("[Bridge] No sink for ") + event_type_name(event.type) +
                          " event on " + event.session_id);
        }
    }

    bool initialized_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};

    std::mutex busy_mutex_;
    std::set<std::string> busy_;

    std::mutex sink_mutex_;
    EventSink sink_;
};

GateService::GateService(const Config& config)
    : pimpl_(std::make_unique<Impl>(config, GateDependencies())) {}

GateService::GateService(const Config& config, GateDependencies deps)
    : pimpl_(std::make_unique<Impl>(config, std::move(deps))) {}

GateService::~GateService() = default;

bool GateService::initialize() {
    return pimpl_->initialize();
}

Result<std::string> GateService::start_session(const std::string& camera_id) {
    return pimpl_->start_session(camera_id);
}

Result<TurnResult> GateService::send_message(const std::string& session_id, const std::string& text) {
    return pimpl_->send_message(session_id, text);
}

Result<SessionState> GateService::get_session(const std::string& session_id) const {
    return pimpl_->get_session(session_id);
}

Result<json> GateService::profile_snapshot(const std::string& session_id) const {
    auto state = pimpl_->get_session(session_id);
    if (!state) {
        return state.error();
    }
    return state.value().to_json();
}

Result<uint64_t> GateService::upload_image(const std::string& session_id, const std::string& base64_image) {
    return pimpl_->upload_image(session_id, base64_image);
}

Result<void> GateService::end_session(const std::string& session_id) {
    return pimpl_->end_session(session_id);
}

json GateService::health() const {
    return pimpl_->health();
}

Result<std::vector<json>> GateService::threat_logs(const std::string& session_id) const {
    return pimpl_->threat_logs(session_id);
}

void GateService::set_event_sink(EventSink sink) {
    pimpl_->set_event_sink(std::move(sink));
}

size_t GateService::process_events_once() {
    return pimpl_->process_events_once();
}

int GateService::run() {
    return pimpl_->run();
}

void GateService::shutdown() {
    pimpl_->shutdown();
}

BoundedQueue<Frame>& GateService::frame_queue() {
    return pimpl_->frames_;
}

vision::VisionPipeline& GateService::vision_pipeline() {
    return *pimpl_->pipeline_;
}

StateBridge& GateService::bridge() {
    return *pimpl_->bridge_;
}

} // namespace gate_sentry
