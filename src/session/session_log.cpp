#include "session/session_log.h"
#include "core/types.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <mutex>

using json = nlohmann::json;

namespace gate_sentry {

class SessionLog::Impl {
public:
    Impl(const std::string& dir, size_t max_entries)
        : dir_(dir), max_entries_(max_entries == 0 ? 1 : max_entries) {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            Logger::warn("[Session] Could not create log dir " + dir_ + ": " + ec.message());
        }
    }

    Result<void> append(const std::string& session_id, const VisionSchema& vision) {
        std::lock_guard<std::mutex> lock(mutex_);
        json log = read_locked(session_id);

        json entry;
        entry["timestamp_ms"] = wall_clock_ms();
        entry["vision"] = vision.to_json();
        log.push_back(entry);

        while (log.size() > max_entries_) {
            log.erase(log.begin());
        }
        return write_locked(session_id, log);
    }

    std::vector<json> entries(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        json log = read_locked(session_id);
        return std::vector<json>(log.begin(), log.end());
    }

    Result<void> clear(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        std::filesystem::remove(path_for(session_id), ec);
        if (ec) {
            return make_io_error("Failed to clear log for " + session_id + ": " + ec.message());
        }
        return Result<void>();
    }

    std::string dir_;

private:
    std::string path_for(const std::string& session_id) const {
        return dir_ + "/" + session_id + ".json";
    }

    json read_locked(const std::string& session_id) const {
        std::ifstream file(path_for(session_id));
        if (!file.is_open()) {
            return json::array();
        }
        try {
            json j;
            file >> j;
            if (j.is_array()) return j;
        } catch (const json::exception& e) {
            Logger::warn("[Session] Corrupt log for " + session_id + ", starting over: " + e.what());
        }
        return json::array();
    }

    Result<void> write_locked(const std::string& session_id, const json& log) {
        std::ofstream file(path_for(session_id), std::ios::trunc);
        if (!file.is_open()) {
            return make_io_error("Failed to open log file for " + session_id);
        }
        file << log.dump(2);
        if (!file) {
            return make_io_error("Failed to write log file for " + session_id);
        }
        return Result<void>();
    }

    size_t max_entries_;
    mutable std::mutex mutex_;
};

SessionLog::SessionLog(const std::string& dir, size_t max_entries)
    : pimpl_(std::make_unique<Impl>(dir, max_entries)) {}

SessionLog::~SessionLog() = default;

Result<void> SessionLog::append(const std::string& session_id, const VisionSchema& vision) {
    return pimpl_->append(session_id, vision);
}

std::vector<json> SessionLog::entries(const std::string& session_id) const {
    return pimpl_->entries(session_id);
}

Result<void> SessionLog::clear(const std::string& session_id) {
    return pimpl_->clear(session_id);
}

const std::string& SessionLog::dir() const {
    return pimpl_->dir_;
}

} // namespace gate_sentry
