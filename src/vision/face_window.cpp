#include "vision/face_window.h"
#include <algorithm>

namespace gate_sentry {
namespace vision {

FaceDetectionWindow::FaceDetectionWindow(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool FaceDetectionWindow::push(bool face_detected) {
    samples_.push_back(face_detected);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }

    if (!all_absent()) {
        absent_latched_ = false;
        return false;
    }
    if (absent_latched_) {
        return false;
    }
    absent_latched_ = true;
    return true;
}

bool FaceDetectionWindow::all_absent() const {
    return full() && std::none_of(samples_.begin(), samples_.end(), [](bool s) { return s; });
}

void FaceDetectionWindow::clear() {
    samples_.clear();
    absent_latched_ = false;
}

} // namespace vision
} // namespace gate_sentry
