#include "vision/vision_pipeline.h"
#include "logger.h"
#include "vision/face_window.h"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace gate_sentry {
namespace vision {

namespace {

struct SessionVision {
    explicit SessionVision(size_t k) : window(k) {}

    FaceDetectionWindow window;
    std::optional<TimePoint> last_escalation;
};

} // namespace

class VisionPipeline::Impl {
public:
    Impl(const VisionConfig& config,
         ImageClassifier& classifier,
         BoundedQueue<Frame>& frames,
         StateBridge& bridge,
         BoundedQueue<GateEvent>& events,
         SessionLog& log)
        : config_(config),
          classifier_(classifier),
          frames_(frames),
          bridge_(bridge),
          events_(events),
          log_(log) {}

    ~Impl() {
        stop();
    }

    FrameAnalysis process_frame(const Frame& frame) {
        FrameAnalysis analysis;
        analysis.vision = classify(frame, analysis.classified);
        const VisionSchema& vision = analysis.vision;

        auto logged = log_.append(frame.session_id, vision);
        if (!logged) {
            Logger::warn("[Vision] " + logged.error().message);
        }

        SessionFieldUpdate fields;
        fields.vision_schema = vision;

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            SessionVision& sv = session_for(frame.session_id);

            if (sv.window.push(vision.face_detected)) {
                analysis.no_face_fired = true;
                fields.session_active = false;
            } else if (vision.face_detected) {
                fields.session_active = true;
            }

            if (vision.is_high_threat() && vision.dangerous_object) {
                auto now = Clock::now();
                bool cooling = sv.last_escalation &&
                    now - *sv.last_escalation < std::chrono::milliseconds(config_.escalation_cooldown_ms);
                if (!cooling) {
                    sv.last_escalation = now;
                    analysis.escalated = true;
                }
            }
        }

        // Queued ahead of the events so an escalation turn sees this schema
        StateUpdateRequest request;
        request.session_id = frame.session_id;
        request.fields = std::move(fields);
        bridge_.submit(std::move(request));

        if (analysis.no_face_fired) {
            LOG_VISION("No face in last " + std::to_string(config_.face_window_size) +
                       " frames for session " + frame.session_id);
            auto cleared = log_.clear(frame.session_id);
            if (!cleared) {
                Logger::warn("[Vision] " + cleared.error().message);
            }
            emit(GateEvent::Type::NoFaceDetected, frame.session_id, config_.no_face_instruction);
        }

        if (analysis.escalated) {
            Logger::warn("[Vision] Escalation for session " + frame.session_id + ": " + vision.details);
            emit(GateEvent::Type::Escalation, frame.session_id, vision.details);
        }

        processed_++;
        return analysis;
    }

    bool run_once() {
        size_t discarded = 0;
        auto frame = frames_.drain_latest(&discarded);
        if (!frame) return false;
        if (discarded > 0) {
            skipped_ += discarded;
            Logger::debug("[Vision] Skipped " + std::to_string(discarded) + " stale frame(s)");
        }
        process_frame(*frame);
        return true;
    }

    void start() {
        if (running_) return;
        running_ = true;
        frames_.reset_wake();
        thread_ = std::thread(&Impl::consumer_loop, this);
        LOG_VISION("Vision consumer started");
    }

    void stop() {
        running_ = false;
        frames_.wake_all();
        if (thread_.joinable()) {
            thread_.join();
            LOG_VISION("Vision consumer stopped");
        }
    }

    void forget_session(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session_id);
    }

    VisionConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> skipped_{0};

private:
    VisionSchema classify(const Frame& frame, bool& classified) {
        classified = false;
        auto reply = classifier_.classify(frame.image);
        if (!reply) {
            Logger::warn("[Vision] Classification failed for frame " + std::to_string(frame.id) +
                         ": " + reply.error().message);
            return VisionSchema();
        }
        auto parsed = parse_vision_reply(reply.value());
        if (!parsed) {
            Logger::warn("[Vision] " + parsed.error().to_string());
            return VisionSchema();
        }
        classified = true;
        return parsed.value();
    }

    SessionVision& session_for(const std::string& session_id) {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            it = sessions_.emplace(session_id, SessionVision(config_.face_window_size)).first;
        }
        return it->second;
    }

    void emit(GateEvent::Type type, const std::string& session_id, const std::string& message) {
        GateEvent event;
        event.type = type;
        event.session_id = session_id;
        event.message = message;
        events_.push(std::move(event));
    }

    void consumer_loop() {
        set_thread_log_tag("vision");
        while (running_) {
            if (!frames_.wait_for_item(config_.consumer_poll_ms)) {
                continue;
            }
            try {
                run_once();
            } catch (const std::exception& e) {
                Logger::error(std::string("[Vision] Frame processing failed: ") + e.what());
            }
        }
    }

    ImageClassifier& classifier_;
    BoundedQueue<Frame>& frames_;
    StateBridge& bridge_;
    BoundedQueue<GateEvent>& events_;
    SessionLog& log_;

    std::mutex sessions_mutex_;
    std::map<std::string, SessionVision> sessions_;
    std::thread thread_;
};

VisionPipeline::VisionPipeline(const VisionConfig& config,
                               ImageClassifier& classifier,
                               BoundedQueue<Frame>& frames,
                               StateBridge& bridge,
                               BoundedQueue<GateEvent>& events,
                               SessionLog& log)
    : pimpl_(std::make_unique<Impl>(config, classifier, frames, bridge, events, log)) {}

VisionPipeline::~VisionPipeline() = default;

FrameAnalysis VisionPipeline::process_frame(const Frame& frame) {
    return pimpl_->process_frame(frame);
}

bool VisionPipeline::run_once() {
    return pimpl_->run_once();
}

void VisionPipeline::start() {
    pimpl_->start();
}

void VisionPipeline::stop() {
    pimpl_->stop();
}

bool VisionPipeline::is_running() const {
    return pimpl_->running_;
}

void VisionPipeline::forget_session(const std::string& session_id) {
    pimpl_->forget_session(session_id);
}

uint64_t VisionPipeline::frames_processed() const {
    return pimpl_->processed_;
}

uint64_t VisionPipeline::frames_skipped() const {
    return pimpl_->skipped_;
}

} // namespace vision
} // namespace gate_sentry
