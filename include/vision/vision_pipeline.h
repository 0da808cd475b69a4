#pragma once

/**
 * @file vision_pipeline.h
 * @brief Frame consumer: classify, debounce presence, escalate threats
 */

#include "bridge/events.h"
#include "bridge/state_bridge.h"
#include "config.h"
#include "core/bounded_queue.h"
#include "core/types.h"
#include "session/session_log.h"
#include "vision/image_classifier.h"
#include <memory>
#include <string>

namespace gate_sentry {
namespace vision {

/**
 * @brief What the pipeline did with one frame
 */
struct FrameAnalysis {
    VisionSchema vision;
    bool classified = false;     ///< false when the default schema was used
    bool no_face_fired = false;  ///< Window entered the all-false state on this frame
    bool escalated = false;      ///< Escalation event emitted
};

/**
 * @brief Vision consumer context
 *
 * Never touches the SessionStore; every state change goes through the
 * StateBridge and every notification through the event queue.
 */
class VisionPipeline {
public:
    VisionPipeline(const VisionConfig& config,
                   ImageClassifier& classifier,
                   BoundedQueue<Frame>& frames,
                   StateBridge& bridge,
                   BoundedQueue<GateEvent>& events,
                   SessionLog& log);
    ~VisionPipeline();

    VisionPipeline(const VisionPipeline&) = delete;
    VisionPipeline& operator=(const VisionPipeline&) = delete;

    /**
     * @brief Run the full per-frame procedure
     *
     * Classification failure falls back to the default schema, which still
     * counts as a no-face sample.
     */
    FrameAnalysis process_frame(const Frame& frame);

    /**
     * @brief Drain the frame queue and process only the newest frame
     * @return false if the queue was empty
     */
    bool run_once();

    /// Start / stop the consumer thread
    void start();
    void stop();
    bool is_running() const;

    /// Drop the session's window and cooldown
    void forget_session(const std::string& session_id);

    /// Frames consumed / discarded by latest-wins draining
    uint64_t frames_processed() const;
    uint64_t frames_skipped() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vision
} // namespace gate_sentry
