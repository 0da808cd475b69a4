#pragma once

#include <cstddef>
#include <deque>

namespace gate_sentry {
namespace vision {

/**
 * @brief Rolling face-presence history for one session
 *
 * Holds at most `capacity` samples; the oldest is evicted first.
 * push() reports the edge into the "full and all false" state exactly
 * once per contiguous absent run.
 */
class FaceDetectionWindow {
public:
    explicit FaceDetectionWindow(size_t capacity);

    /**
     * @brief Record one frame's face_detected flag
     * @return true only on the frame that makes the window full and all-false
     */
    bool push(bool face_detected);

    /// Window is full and contains no detections
    bool all_absent() const;

    size_t size() const { return samples_.size(); }
    size_t capacity() const { return capacity_; }
    bool full() const { return samples_.size() == capacity_; }

    void clear();

private:
    size_t capacity_;
    std::deque<bool> samples_;
    bool absent_latched_ = false;
};

} // namespace vision
} // namespace gate_sentry
