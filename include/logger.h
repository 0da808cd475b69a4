#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace gate_sentry {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 * 
 * Provides structured logging with levels and optional file output.
 * Shared by the orchestrator, vision consumer and capture threads.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO, 
                          const std::string& output_file = "");
    
    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();
    
    /**
     * @brief Log a message at DEBUG level
     */
    static void debug(const std::string& message);
    
    /**
     * @brief Log a message at INFO level
     */
    static void info(const std::string& message);
    
    /**
     * @brief Log a message at WARN level
     */
    static void warn(const std::string& message);
    
    /**
     * @brief Log a message at ERROR level
     */
    static void error(const std::string& message);
    
    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);
    
    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;
    
    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

/**
 * @brief Parse a level name from config ("debug", "info", "warn", "error")
 * @return Matching level, INFO when unrecognized
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Name the calling thread in log lines (e.g. "vision", "capture")
 */
void set_thread_log_tag(const std::string& tag);

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) gate_sentry::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) gate_sentry::Logger::info(msg)
#define LOG_WARN(msg) gate_sentry::Logger::warn(msg)
#define LOG_ERROR(msg) gate_sentry::Logger::error(msg)

// Component-specific logging macros
#define LOG_GRAPH(msg) gate_sentry::Logger::info(std::string("[Graph] ") + (msg))
#define LOG_SESSION(msg) gate_sentry::Logger::info(std::string("[Session] ") + (msg))
#define LOG_VISION(msg) gate_sentry::Logger::info(std::string("[Vision] ") + (msg))
#define LOG_BRIDGE(msg) gate_sentry::Logger::debug(std::string("[Bridge] ") + (msg))
#define LOG_LLM(msg) gate_sentry::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_NOTIFY(msg) gate_sentry::Logger::info(std::string("[Notify] ") + (msg))
#define LOG_TRACE(session_id, node, data) gate_sentry::Logger::debug(std::string("[trace] session_id=") + (session_id) + " node=" + (node) + " " + (data))

} // namespace gate_sentry
