#pragma once

#include "config.h"
#include "core/types.h"
#include "errors.h"
#include <memory>
#include <string>
#include <vector>

namespace gate_sentry {

/**
 * @brief One chat request to an Ollama-compatible /api/chat endpoint
 */
struct ChatRequest {
    std::vector<Message> messages;
    std::vector<std::string> images;  ///< Raw image bytes, attached to the last message
    std::string format_json;          ///< Optional JSON schema constraining the reply
};

/**
 * @brief Blocking HTTP client for one model role
 *
 * Each role (extraction, validation, decision, vision, ...) gets its own
 * instance so model name and temperature stay independent. Safe to call
 * from several threads: every request uses its own curl handle.
 * curl_global_init() must have run before the first request.
 */
class LLMClient {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient();

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    /**
     * @brief Send a chat request and return the assistant text
     *
     * Reasoning blocks (<think>...</think>) are stripped from the reply.
     * @return Reply text, or NetworkError / Timeout / ParseError
     */
    Result<std::string> chat(const ChatRequest& request);

    /**
     * @brief Single user prompt, no history
     */
    Result<std::string> complete(const std::string& prompt);

    const LLMConfig& config() const;

    /**
     * @brief Build the JSON request body (exposed for tests)
     */
    static std::string build_request_body(const LLMConfig& config, const ChatRequest& request);

    /**
     * @brief Extract message.content from an /api/chat response body
     */
    static Result<std::string> parse_response_body(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace gate_sentry
