#pragma once

#include "core/constants.h"
#include <string>
#include <cstdint>
#include <vector>

namespace gate_sentry {

/// One chat-model role (endpoint, model, sampling)
struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "gemma3n:e2b";
    float temperature = 0.0f;
    int timeout_ms = constants::network::LLM_TIMEOUT_MS;
    int max_tokens = 0;        ///< 0 = no limit
    int keep_alive_sec = 0;    ///< Ollama keep_alive (0 = server default)
};

/// A separate client handle per role so each can use its own model/temperature
struct ModelsConfig {
    LLMConfig main;            ///< Field extraction
    LLMConfig validation;      ///< Input relevance
    LLMConfig session;         ///< New-visitor detection
    LLMConfig summary;         ///< History summarization
    LLMConfig decision;        ///< Access classification
    LLMConfig vision;          ///< Image threat assessment

    ModelsConfig() {
        validation.temperature = 0.1f;
        session.temperature = 0.1f;
        summary.temperature = 0.1f;
        decision.model_name = "qwen3:4b";
        vision.model_name = "gemma3:4b";
    }
};

struct DialogConfig {
    std::string system_prompt =
        "You are a helpful assistant at the gate. Ask necessary questions and decide on access.";
    std::string reprompt =
        "I didn't understand that. Please provide relevant information for your visit. "
        "I need to know your name, purpose of visit, company/organization, and any "
        "security-related information.";
    std::string reposition_prompt = "Please position yourself in front of the camera.";
    std::string fallback_question = "Can you tell me more about yourself?";
    /// Synthetic visitor line used when a vision escalation forces a turn
    std::string escalation_message = "I am here to visit someone";
    size_t max_human_messages = constants::dialog::MAX_HUMAN_MESSAGES;
    std::string history_mode = "summarize";  ///< "summarize" | "shorten"
    size_t compact_min_messages = constants::dialog::COMPACT_MIN_MESSAGES;
    size_t shorten_keep_last = constants::dialog::SHORTEN_KEEP_LAST;
};

struct VisionConfig {
    bool enabled = false;     ///< When false, sessions start active and no frames are analyzed
    size_t face_window_size = constants::vision::FACE_WINDOW_SIZE;
    int escalation_cooldown_ms = constants::vision::ESCALATION_COOLDOWN_MS;
    size_t frame_queue_capacity = constants::vision::FRAME_QUEUE_CAPACITY;
    int capture_interval_ms = constants::vision::CAPTURE_INTERVAL_MS;
    int consumer_poll_ms = constants::vision::CONSUMER_POLL_MS;
    std::string camera_id = "gate-1";
    std::string snapshot_dir;  ///< Capture producer polls this dir (empty = no producer)
    std::string no_face_instruction = "Please position yourself in front of the camera.";
    size_t session_log_max_entries = constants::vision::SESSION_LOG_MAX_ENTRIES;
};

struct BridgeConfig {
    size_t request_queue_capacity = constants::bridge::REQUEST_QUEUE_CAPACITY;
    size_t max_batch = constants::bridge::MAX_BATCH;
    size_t event_queue_capacity = constants::bridge::EVENT_QUEUE_CAPACITY;
    size_t max_events_per_cycle = constants::bridge::MAX_EVENTS_PER_CYCLE;
    std::string greeting = "Welcome to the gate. Please tell me your name and the purpose of your visit.";
    std::string farewell = "Goodbye. This session has been closed.";
};

struct NotifyConfig {
    std::string transport = "log";  ///< "log" | "smtp"
    std::string smtp_url = "smtps://smtp.gmail.com:465";
    std::string sender_email;
    std::string username;           ///< Defaults to sender_email
    std::string password_env = "GATE_SMTP_PASSWORD";
    int timeout_ms = constants::network::SMTP_TIMEOUT_MS;
};

struct PathsConfig {
    std::string contacts_file = "config/contacts.json";
    std::string employees_file = "config/employees.json";
    std::string session_log_dir = "data/logs";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    ModelsConfig models;
    DialogConfig dialog;
    VisionConfig vision;
    BridgeConfig bridge;
    NotifyConfig notify;
    PathsConfig paths;
    LoggingConfig logging;

    /**
     * @brief Load config from JSON; missing keys keep defaults
     *
     * A missing or unparsable file logs a warning and yields defaults.
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Check value ranges
     * @return Empty string if valid, otherwise the first problem found
     */
    std::string validate() const;
};

} // namespace gate_sentry
