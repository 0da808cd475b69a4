#include "config.h"
#include "logger.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

/// Role block inherits endpoint/timeout from the shared "models" level
LLMConfig parse_llm_role(const json& models, const std::string& role, LLMConfig config) {
    config.endpoint = get_or_default(models, "endpoint", config.endpoint);
    config.timeout_ms = get_or_default(models, "timeout_ms", config.timeout_ms);
    config.keep_alive_sec = get_or_default(models, "keep_alive_sec", config.keep_alive_sec);
    if (!models.contains(role) || !models[role].is_object()) return config;

    const auto& r = models[role];
    config.endpoint = get_or_default(r, "endpoint", config.endpoint);
    config.model_name = get_or_default(r, "model_name", config.model_name);
    config.temperature = get_or_default(r, "temperature", config.temperature);
    config.timeout_ms = get_or_default(r, "timeout_ms", config.timeout_ms);
    config.max_tokens = get_or_default(r, "max_tokens", config.max_tokens);
    config.keep_alive_sec = get_or_default(r, "keep_alive_sec", config.keep_alive_sec);
    return config;
}

ModelsConfig parse_models_config(const json& j) {
    ModelsConfig config;
    if (!j.contains("models")) return config;

    const auto& m = j["models"];
    config.main = parse_llm_role(m, "main", config.main);
    config.validation = parse_llm_role(m, "validation", config.validation);
    config.session = parse_llm_role(m, "session", config.session);
    config.summary = parse_llm_role(m, "summary", config.summary);
    config.decision = parse_llm_role(m, "decision", config.decision);
    config.vision = parse_llm_role(m, "vision", config.vision);
    return config;
}

DialogConfig parse_dialog_config(const json& j) {
    DialogConfig config;
    if (!j.contains("dialog")) return config;

    const auto& d = j["dialog"];
    config.system_prompt = get_or_default(d, "system_prompt", config.system_prompt);
    config.reprompt = get_or_default(d, "reprompt", config.reprompt);
    config.reposition_prompt = get_or_default(d, "reposition_prompt", config.reposition_prompt);
    config.fallback_question = get_or_default(d, "fallback_question", config.fallback_question);
    config.escalation_message = get_or_default(d, "escalation_message", config.escalation_message);
    config.max_human_messages = get_or_default(d, "max_human_messages", config.max_human_messages);
    config.history_mode = get_or_default(d, "history_mode", config.history_mode);
    config.compact_min_messages = get_or_default(d, "compact_min_messages", config.compact_min_messages);
    config.shorten_keep_last = get_or_default(d, "shorten_keep_last", config.shorten_keep_last);
    return config;
}

VisionConfig parse_vision_config(const json& j) {
    VisionConfig config;
    if (!j.contains("vision")) return config;

    const auto& v = j["vision"];
    config.enabled = get_or_default(v, "enabled", config.enabled);
    config.face_window_size = get_or_default(v, "face_window_size", config.face_window_size);
    config.escalation_cooldown_ms = get_or_default(v, "escalation_cooldown_ms", config.escalation_cooldown_ms);
    config.frame_queue_capacity = get_or_default(v, "frame_queue_capacity", config.frame_queue_capacity);
    config.capture_interval_ms = get_or_default(v, "capture_interval_ms", config.capture_interval_ms);
    config.consumer_poll_ms = get_or_default(v, "consumer_poll_ms", config.consumer_poll_ms);
    config.camera_id = get_or_default(v, "camera_id", config.camera_id);
    config.snapshot_dir = get_or_default(v, "snapshot_dir", config.snapshot_dir);
    config.no_face_instruction = get_or_default(v, "no_face_instruction", config.no_face_instruction);
    config.session_log_max_entries = get_or_default(v, "session_log_max_entries", config.session_log_max_entries);
    return config;
}

BridgeConfig parse_bridge_config(const json& j) {
    BridgeConfig config;
    if (!j.contains("bridge")) return config;

    const auto& b = j["bridge"];
    config.request_queue_capacity = get_or_default(b, "request_queue_capacity", config.request_queue_capacity);
    config.max_batch = get_or_default(b, "max_batch", config.max_batch);
    config.event_queue_capacity = get_or_default(b, "event_queue_capacity", config.event_queue_capacity);
    config.max_events_per_cycle = get_or_default(b, "max_events_per_cycle", config.max_events_per_cycle);
    config.greeting = get_or_default(b, "greeting", config.greeting);
    config.farewell = get_or_default(b, "farewell", config.farewell);
    return config;
}

NotifyConfig parse_notify_config(const json& j) {
    NotifyConfig config;
    if (!j.contains("notify")) return config;

    const auto& n = j["notify"];
    config.transport = get_or_default(n, "transport", config.transport);
    config.smtp_url = get_or_default(n, "smtp_url", config.smtp_url);
    config.sender_email = get_or_default(n, "sender_email", config.sender_email);
    config.username = get_or_default(n, "username", config.username);
    config.password_env = get_or_default(n, "password_env", config.password_env);
    config.timeout_ms = get_or_default(n, "timeout_ms", config.timeout_ms);
    return config;
}

PathsConfig parse_paths_config(const json& j) {
    PathsConfig config;
    if (!j.contains("paths")) return config;

    const auto& p = j["paths"];
    config.contacts_file = get_or_default(p, "contacts_file", config.contacts_file);
    config.employees_file = get_or_default(p, "employees_file", config.employees_file);
    config.session_log_dir = get_or_default(p, "session_log_dir", config.session_log_dir);
    return config;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& l = j["logging"];
    config.level = get_or_default(l, "level", config.level);
    config.file = get_or_default(l, "file", config.file);
    return config;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + path + ", using defaults");
        return cfg;
    }

    try {
        json j;
        file >> j;
        cfg.models = parse_models_config(j);
        cfg.dialog = parse_dialog_config(j);
        cfg.vision = parse_vision_config(j);
        cfg.bridge = parse_bridge_config(j);
        cfg.notify = parse_notify_config(j);
        cfg.paths = parse_paths_config(j);
        cfg.logging = parse_logging_config(j);
    } catch (const json::exception& e) {
        Logger::warn("Failed to parse config " + path + ": " + e.what() + ", using defaults");
        return Config();
    }

    return cfg;
}

std::string Config::validate() const {
    if (dialog.history_mode != "summarize" && dialog.history_mode != "shorten") {
        return "dialog.history_mode must be \"summarize\" or \"shorten\"";
    }
    if (dialog.compact_min_messages < 3) {
        return "dialog.compact_min_messages must be at least 3";
    }
    if (dialog.shorten_keep_last == 0) {
        return "dialog.shorten_keep_last must be positive";
    }
    if (dialog.max_human_messages == 0) {
        return "dialog.max_human_messages must be positive";
    }
    if (vision.face_window_size == 0) {
        return "vision.face_window_size must be positive";
    }
    if (vision.escalation_cooldown_ms < 0) {
        return "vision.escalation_cooldown_ms must not be negative";
    }
    if (vision.frame_queue_capacity == 0 || bridge.request_queue_capacity == 0 ||
        bridge.event_queue_capacity == 0) {
        return "queue capacities must be positive";
    }
    if (bridge.max_batch == 0 || bridge.max_events_per_cycle == 0) {
        return "bridge batch sizes must be positive";
    }
    if (notify.transport != "log" && notify.transport != "smtp") {
        return "notify.transport must be \"log\" or \"smtp\"";
    }
    if (notify.transport == "smtp" && notify.sender_email.empty()) {
        return "notify.sender_email is required for smtp transport";
    }
    return "";
}

} // namespace gate_sentry
