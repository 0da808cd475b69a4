#include "vision/frame_source.h"
#include "logger.h"
#include "utils.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace gate_sentry {
namespace vision {

namespace {

bool is_image_file(const fs::path& path) {
    std::string ext = utils::lower_copy(path.extension().string());
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

} // namespace

uint64_t next_frame_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

DirectoryFrameSource::DirectoryFrameSource(const std::string& dir) : dir_(dir) {}

Result<std::string> DirectoryFrameSource::capture() {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return make_io_error("Snapshot directory not found: " + dir_);
    }

    fs::path newest;
    fs::file_time_type newest_time{};
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file() || !is_image_file(entry.path())) continue;
        auto t = entry.last_write_time(ec);
        if (ec) continue;
        if (newest.empty() || t > newest_time) {
            newest = entry.path();
            newest_time = t;
        }
    }
    if (ec) {
        return make_io_error("Failed to list " + dir_ + ": " + ec.message());
    }
    if (newest.empty()) {
        return make_io_error("No snapshot in " + dir_);
    }

    std::ifstream file(newest, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Failed to open " + newest.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

CaptureProducer::CaptureProducer(FrameSource& source,
                                 BoundedQueue<Frame>& frames,
                                 const std::string& camera_id,
                                 int interval_ms)
    : source_(source), frames_(frames), camera_id_(camera_id), interval_ms_(interval_ms) {}

CaptureProducer::~CaptureProducer() {
    stop();
}

void CaptureProducer::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&CaptureProducer::run, this);
    LOG_VISION("Capture producer started (camera " + camera_id_ + ", every " +
               std::to_string(interval_ms_) + " ms)");
}

void CaptureProducer::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        LOG_VISION("Capture producer stopped");
    }
}

void CaptureProducer::bind_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = session_id;
}

bool CaptureProducer::unbind_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id.empty() || session_id_ != session_id) return false;
    session_id_.clear();
    return true;
}

std::string CaptureProducer::bound_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

Result<uint64_t> CaptureProducer::capture_once() {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id = session_id_;
    }
    if (session_id.empty()) {
        return make_error(ErrorType::InvalidState, "No session bound to camera " + camera_id_);
    }

    auto image = source_.capture();
    if (!image) {
        return image.error();
    }

    Frame frame;
    frame.id = next_frame_id();
    frame.session_id = session_id;
    frame.camera_id = camera_id_;
    frame.image = std::move(image.value());
    frame.captured_at = Clock::now();
    uint64_t id = frame.id;
    frames_.push(std::move(frame));
    return id;
}

void CaptureProducer::run() {
    set_thread_log_tag("capture");
    while (running_) {
        auto result = capture_once();
        if (!result && result.error().type != ErrorType::InvalidState) {
            Logger::debug("[Vision] Capture skipped: " + result.error().message);
        }

        // Sleep in short slices so stop() is prompt
        auto deadline = Clock::now() + std::chrono::milliseconds(interval_ms_);
        while (running_ && Clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

} // namespace vision
} // namespace gate_sentry
