#pragma once

/**
 * @file image_classifier.h
 * @brief Image threat assessment interface
 */

#include "config.h"
#include "errors.h"
#include "session/session_state.h"
#include <memory>
#include <string>

namespace gate_sentry {
namespace vision {

/**
 * @brief Abstract image classifier
 */
class ImageClassifier {
public:
    virtual ~ImageClassifier() = default;

    /**
     * @brief Assess one frame
     * @param image Raw encoded image bytes
     * @return Raw model reply expected to hold a VisionSchema-shaped JSON object
     */
    virtual Result<std::string> classify(const std::string& image) = 0;
};

/**
 * @brief Parse a classifier reply into a VisionSchema
 *
 * Falls back to the first {...} span when the reply is not pure JSON.
 * Missing fields take safe defaults.
 * @return VisionFailure when no JSON object can be parsed
 */
Result<VisionSchema> parse_vision_reply(const std::string& reply);

/**
 * @brief ImageClassifier backed by an Ollama vision model
 */
class OllamaImageClassifier : public ImageClassifier {
public:
    explicit OllamaImageClassifier(const LLMConfig& config);
    ~OllamaImageClassifier() override;

    Result<std::string> classify(const std::string& image) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vision
} // namespace gate_sentry
