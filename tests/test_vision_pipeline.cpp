/**
 * Vision debounce pipeline with a scripted classifier.
 * Asserts:
 * - The face window fires once per contiguous all-false run of length K.
 * - K absent frames deactivate the session, clear its log and emit one no-face event.
 * - Latest-wins draining analyzes only the newest queued frame.
 * - Escalations respect the per-session cooldown.
 * - A listener reacting to an escalation already finds the high-threat schema in the bridge.
 * - Classifier failures count as no-face samples.
 * - Frame queue overflow drops the oldest frames.
 * - The consumer can be stopped and started again without spinning.
 * - The capture producer is only unbound by the session it is bound to.
 *
 * Run from build dir: ./test_vision_pipeline
 */

#include "bridge/state_bridge.h"
#include "core/bounded_queue.h"
#include "session/session_log.h"
#include "session/session_store.h"
#include "utils.h"
#include "vision/face_window.h"
#include "vision/frame_source.h"
#include "vision/image_classifier.h"
#include "vision/vision_pipeline.h"
#include "fakes.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

using namespace gate_sentry;
using gate_sentry::testing::FakeClassifier;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static Frame make_frame(const std::string& session_id, const std::string& image) {
    Frame frame;
    frame.id = vision::next_frame_id();
    frame.session_id = session_id;
    frame.camera_id = "gate-1";
    frame.image = image;
    frame.captured_at = Clock::now();
    return frame;
}

class StillCamera : public vision::FrameSource {
public:
    Result<std::string> capture() override { return std::string("still"); }
};

static size_t count_events(const std::vector<GateEvent>& events, GateEvent::Type type) {
    size_t n = 0;
    for (const auto& e : events) {
        if (e.type == type) n++;
    }
    return n;
}

int main() {
    const std::string log_dir = (std::filesystem::temp_directory_path() /
                                 ("gate_sentry_vision_" + utils::random_hex_id(8))).string();

    // --- FaceDetectionWindow ---
    {
        vision::FaceDetectionWindow window(4);
        ASSERT(!window.push(false));
        ASSERT(!window.push(false));
        ASSERT(!window.push(false));
        ASSERT(window.push(false));
        ASSERT(window.all_absent());
        for (int i = 0; i < 10; ++i) {
            ASSERT(!window.push(false));
        }
        ASSERT(window.size() == 4);

        // A detection ends the run; the next full absent run fires again
        ASSERT(!window.push(true));
        ASSERT(!window.all_absent());
        ASSERT(!window.push(false));
        ASSERT(!window.push(false));
        ASSERT(!window.push(false));
        ASSERT(window.push(false));
    }

    // --- parse_vision_reply ---
    {
        auto full = vision::parse_vision_reply(
            R"({"face_detected": true, "angry_face": true, "dangerous_object": true, "threat_level": "HIGH", "details": "knife"})");
        ASSERT(full.is_ok());
        ASSERT(full.value().face_detected);
        ASSERT(full.value().is_high_threat());
        ASSERT(full.value().details == "knife");

        auto wrapped = vision::parse_vision_reply("Sure! {\"face_detected\": true} Hope that helps.");
        ASSERT(wrapped.is_ok());
        ASSERT(wrapped.value().face_detected);
        ASSERT(!wrapped.value().dangerous_object);
        ASSERT(wrapped.value().threat_level == ThreatLevel::Low);

        auto garbage = vision::parse_vision_reply("I cannot see anything");
        ASSERT(garbage.is_error());
        if (garbage.is_error()) {
            ASSERT(garbage.error().type == ErrorType::VisionFailure);
        }
    }

    VisionConfig config;
    config.face_window_size = 4;
    config.escalation_cooldown_ms = 300;
    BridgeConfig bridge_config;

    // --- no face for a full window ---
    {
        FakeClassifier classifier;
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);

        ASSERT(store.create(SessionState::create("v1", "preamble", true)).is_ok());
        auto seeded = store.modify("v1", [](SessionState& s) {
            s.messages.push_back(Message::human("I'm Alice"));
            s.visitor_profile.set_if_absent(ProfileField::Name, "Alice");
        });
        ASSERT(seeded.is_ok());

        classifier.set_face(true);
        pipeline.process_frame(make_frame("v1", "img"));
        bridge.drain_once();
        ASSERT(log.entries("v1").size() == 1);

        classifier.set_face(false);
        size_t fired = 0;
        for (int i = 0; i < 3; ++i) {
            if (pipeline.process_frame(make_frame("v1", "img")).no_face_fired) fired++;
            bridge.drain_once();
        }
        ASSERT(fired == 0);
        ASSERT(store.snapshot("v1").value().session_active);

        vision::FrameAnalysis fourth = pipeline.process_frame(make_frame("v1", "img"));
        bridge.drain_once();
        ASSERT(fourth.no_face_fired);
        ASSERT(log.entries("v1").empty());

        SessionState after = store.snapshot("v1").value();
        ASSERT(!after.session_active);
        ASSERT(after.epoch == 1);
        ASSERT(after.messages.size() == 1);
        ASSERT(after.visitor_profile.name.is_unset());

        for (int i = 0; i < 10; ++i) {
            if (pipeline.process_frame(make_frame("v1", "img")).no_face_fired) fired++;
            bridge.drain_once();
        }
        ASSERT(fired == 0);

        std::vector<GateEvent> emitted = events.drain(100);
        ASSERT(count_events(emitted, GateEvent::Type::NoFaceDetected) == 1);
        ASSERT(count_events(emitted, GateEvent::Type::AgentMessage) == 1);
        ASSERT(store.snapshot("v1").value().epoch == 1);
        ASSERT(log.entries("v1").size() == 10);

        // Face returns: one greeting
        classifier.set_face(true);
        pipeline.process_frame(make_frame("v1", "img"));
        pipeline.process_frame(make_frame("v1", "img"));
        bridge.drain_once();
        emitted = events.drain(100);
        ASSERT(count_events(emitted, GateEvent::Type::AgentMessage) == 1);
        ASSERT(emitted.size() == 1);
        if (!emitted.empty()) {
            ASSERT(emitted[0].message == bridge_config.greeting);
        }
        ASSERT(store.snapshot("v1").value().session_active);
        ASSERT(log.clear("v1").is_ok());
    }

    // --- latest-wins ---
    {
        FakeClassifier classifier;
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);

        for (int i = 1; i <= 5; ++i) {
            frames.push(make_frame("v2", "frame-" + std::to_string(i)));
        }
        ASSERT(pipeline.run_once());
        ASSERT(classifier.seen.size() == 1);
        if (!classifier.seen.empty()) {
            ASSERT(classifier.seen[0] == "frame-5");
        }
        ASSERT(pipeline.frames_skipped() == 4);
        ASSERT(pipeline.frames_processed() == 1);
        ASSERT(frames.empty());
        ASSERT(!pipeline.run_once());

        // Updates for sessions the store does not know are dropped by the bridge
        ASSERT(bridge.drain_once() == 0);
        ASSERT(log.clear("v2").is_ok());
    }

    // --- escalation cooldown ---
    {
        FakeClassifier classifier;
        classifier.set_threat();
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);

        size_t escalations = 0;
        for (int i = 0; i < 6; ++i) {
            if (pipeline.process_frame(make_frame("v3", "img")).escalated) escalations++;
        }
        ASSERT(escalations == 1);

        // Cooldown is per session
        ASSERT(pipeline.process_frame(make_frame("v4", "img")).escalated);

        std::this_thread::sleep_for(std::chrono::milliseconds(config.escalation_cooldown_ms + 100));
        ASSERT(pipeline.process_frame(make_frame("v3", "img")).escalated);

        std::vector<GateEvent> emitted = events.drain(100);
        ASSERT(count_events(emitted, GateEvent::Type::Escalation) == 3);

        // High threat without a dangerous object is not escalated
        classifier.reply = R"({"face_detected": true, "angry_face": true, "dangerous_object": false, "threat_level": "high", "details": "shouting"})";
        ASSERT(!pipeline.process_frame(make_frame("v5", "img")).escalated);
        ASSERT(log.clear("v3").is_ok());
        ASSERT(log.clear("v4").is_ok());
        ASSERT(log.clear("v5").is_ok());
    }

    // --- escalation listener sees the schema that caused it ---
    {
        FakeClassifier classifier;
        classifier.set_threat();
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);
        ASSERT(store.create(SessionState::create("v9", "preamble", true)).is_ok());

        bool saw_escalation = false;
        bool schema_applied = false;
        std::thread listener([&]() {
            if (!events.wait_for_item(2000)) return;
            for (const auto& event : events.drain(10)) {
                if (event.type != GateEvent::Type::Escalation) continue;
                saw_escalation = true;
                bridge.drain_once();
                auto state = store.snapshot("v9");
                schema_applied = state.is_ok() && state.value().vision_schema.has_value() &&
                                 state.value().vision_schema->is_high_threat();
            }
        });
        ASSERT(pipeline.process_frame(make_frame("v9", "img")).escalated);
        listener.join();
        ASSERT(saw_escalation);
        ASSERT(schema_applied);
        ASSERT(log.clear("v9").is_ok());
    }

    // --- classifier failure counts as absent ---
    {
        FakeClassifier classifier;
        classifier.fail = true;
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);

        vision::FrameAnalysis last;
        for (int i = 0; i < 4; ++i) {
            last = pipeline.process_frame(make_frame("v6", "img"));
            ASSERT(!last.classified);
            ASSERT(!last.vision.face_detected);
        }
        ASSERT(last.no_face_fired);
        ASSERT(log.clear("v6").is_ok());
    }

    // --- frame queue overflow ---
    {
        BoundedQueue<Frame> frames(10, "frames");
        for (int i = 1; i <= 15; ++i) {
            frames.push(make_frame("v7", "frame-" + std::to_string(i)));
        }
        ASSERT(frames.size() == 10);
        ASSERT(frames.dropped() == 5);
        size_t discarded = 0;
        auto latest = frames.drain_latest(&discarded);
        ASSERT(latest.has_value());
        ASSERT(latest->image == "frame-15");
        ASSERT(discarded == 9);
    }

    // --- wake_all is re-armed by reset_wake ---
    {
        BoundedQueue<int> queue(2, "wake");
        queue.wake_all();
        auto t0 = Clock::now();
        ASSERT(!queue.wait_for_item(500));
        ASSERT(Clock::now() - t0 < std::chrono::milliseconds(400));

        queue.reset_wake();
        t0 = Clock::now();
        ASSERT(!queue.wait_for_item(80));
        ASSERT(Clock::now() - t0 >= std::chrono::milliseconds(60));
    }

    // --- consumer restart ---
    {
        FakeClassifier classifier;
        classifier.set_face(true);
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        BoundedQueue<GateEvent> events(bridge_config.event_queue_capacity, "events");
        SessionStore store;
        StateBridge bridge(store, events, bridge_config);
        SessionLog log(log_dir, config.session_log_max_entries);
        vision::VisionPipeline pipeline(config, classifier, frames, bridge, events, log);

        pipeline.start();
        pipeline.stop();
        ASSERT(!pipeline.is_running());

        pipeline.start();
        ASSERT(pipeline.is_running());
        frames.push(make_frame("v8", "after-restart"));
        auto deadline = Clock::now() + std::chrono::seconds(2);
        while (pipeline.frames_processed() == 0 && Clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        pipeline.stop();
        ASSERT(pipeline.frames_processed() == 1);
        ASSERT(classifier.seen.size() == 1);
        ASSERT(log.clear("v8").is_ok());
    }

    // --- capture producer binding ---
    {
        StillCamera camera;
        BoundedQueue<Frame> frames(config.frame_queue_capacity, "frames");
        vision::CaptureProducer producer(camera, frames, "gate-1", 1000);

        auto unbound = producer.capture_once();
        ASSERT(unbound.is_error());
        if (unbound.is_error()) {
            ASSERT(unbound.error().type == ErrorType::InvalidState);
        }

        producer.bind_session("current");
        ASSERT(!producer.unbind_session("previous"));
        ASSERT(producer.bound_session() == "current");
        ASSERT(producer.capture_once().is_ok());
        ASSERT(frames.size() == 1);

        ASSERT(producer.unbind_session("current"));
        ASSERT(producer.bound_session().empty());
        ASSERT(producer.capture_once().is_error());
        ASSERT(frames.size() == 1);
    }

    std::error_code ec;
    std::filesystem::remove_all(log_dir, ec);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All vision pipeline tests passed.\n";
    return 0;
}
