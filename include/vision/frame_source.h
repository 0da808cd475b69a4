#pragma once

/**
 * @file frame_source.h
 * @brief Camera frame acquisition and the timed capture producer
 */

#include "core/bounded_queue.h"
#include "core/types.h"
#include "errors.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gate_sentry {
namespace vision {

/**
 * @brief Source of encoded camera images
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /// Grab the current image as raw encoded bytes
    virtual Result<std::string> capture() = 0;
};

/**
 * @brief Reads the newest .jpg/.jpeg/.png in a snapshot directory
 *
 * Pairs with any external grabber that drops snapshots into a folder.
 */
class DirectoryFrameSource : public FrameSource {
public:
    explicit DirectoryFrameSource(const std::string& dir);

    Result<std::string> capture() override;

private:
    std::string dir_;
};

/// Monotonic id for frames from any producer
uint64_t next_frame_id();

/**
 * @brief Captures a frame every interval and enqueues it for the bound session
 *
 * Frames are only produced while a session is bound.
 */
class CaptureProducer {
public:
    CaptureProducer(FrameSource& source,
                    BoundedQueue<Frame>& frames,
                    const std::string& camera_id,
                    int interval_ms);
    ~CaptureProducer();

    CaptureProducer(const CaptureProducer&) = delete;
    CaptureProducer& operator=(const CaptureProducer&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    /// Session that receives captured frames; empty string unbinds
    void bind_session(const std::string& session_id);

    /// Unbind only if `session_id` is the bound session; true if it was
    bool unbind_session(const std::string& session_id);

    std::string bound_session() const;

    /// Capture and enqueue one frame now
    Result<uint64_t> capture_once();

private:
    void run();

    FrameSource& source_;
    BoundedQueue<Frame>& frames_;
    std::string camera_id_;
    int interval_ms_;

    mutable std::mutex session_mutex_;
    std::string session_id_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace vision
} // namespace gate_sentry
