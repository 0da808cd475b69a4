#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

class LLMClient::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {}

    Result<std::string> chat(const ChatRequest& request) {
        std::string request_json = build_request_body(config_, request);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(constants::network::CONNECT_TIMEOUT_MS));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        auto start = Clock::now();
        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            LOG_LLM(config_.model_name + " timed out after " + std::to_string(ms_since(start)) + "ms");
            return make_timeout_error("Model request timed out: " + config_.model_name);
        }
        if (res != CURLE_OK) {
            LOG_LLM(config_.model_name + " request failed: " + curl_easy_strerror(res));
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_code >= 400) {
            LOG_LLM(config_.model_name + " HTTP " + std::to_string(http_code) + ": " + response_buffer);
            return make_network_error("HTTP " + std::to_string(http_code) + " from " + config_.endpoint);
        }

        Logger::debug("[LLM] " + config_.model_name + " replied in " +
                      std::to_string(ms_since(start)) + "ms");
        return parse_response_body(response_buffer);
    }

    const LLMConfig& config() const { return config_; }

private:
    LLMConfig config_;
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

Result<std::string> LLMClient::chat(const ChatRequest& request) {
    return pimpl_->chat(request);
}

Result<std::string> LLMClient::complete(const std::string& prompt) {
    ChatRequest request;
    request.messages.push_back(Message::human(prompt));
    return pimpl_->chat(request);
}

const LLMConfig& LLMClient::config() const {
    return pimpl_->config();
}

std::string LLMClient::build_request_body(const LLMConfig& config, const ChatRequest& request) {
    json messages = json::array();
    for (size_t i = 0; i < request.messages.size(); ++i) {
        const Message& m = request.messages[i];
        json msg;
        msg["role"] = role_to_chat_role(m.role);
        msg["content"] = m.content;
        if (i + 1 == request.messages.size() && !request.images.empty()) {
            json images = json::array();
            for (const auto& image : request.images) {
                images.push_back(utils::base64_encode(image));
            }
            msg["images"] = images;
        }
        messages.push_back(msg);
    }

    json body;
    body["model"] = config.model_name;
    body["messages"] = messages;
    body["stream"] = false;

    json options;
    options["temperature"] = config.temperature;
    if (config.max_tokens > 0) {
        options["num_predict"] = config.max_tokens;
    }
    body["options"] = options;

    if (config.keep_alive_sec > 0) {
        body["keep_alive"] = std::to_string(config.keep_alive_sec) + "s";
    }
    if (!request.format_json.empty()) {
        try {
            body["format"] = json::parse(request.format_json);
        } catch (const json::exception& e) {
            Logger::warn("Ignoring invalid format schema: " + std::string(e.what()));
        }
    }
    return body.dump();
}

Result<std::string> LLMClient::parse_response_body(const std::string& body) {
    try {
        json response = json::parse(body);
        if (response.contains("error")) {
            return make_network_error("Model error: " + response["error"].dump());
        }
        if (!response.contains("message") || !response["message"].contains("content")) {
            return make_parse_error("No message.content in response");
        }
        std::string content = response["message"]["content"].get<std::string>();
        return utils::strip_think_block(content);
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }
}

} // namespace gate_sentry
