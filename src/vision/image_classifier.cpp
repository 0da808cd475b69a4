#include "vision/image_classifier.h"
#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {
namespace vision {

namespace {

const char* kThreatPrompt =
    "You are the camera of a security checkpoint. Look at the image and report:\n"
    "- face_detected: is a human face clearly visible?\n"
    "- angry_face: does the person look angry or aggressive?\n"
    "- dangerous_object: is a weapon or other dangerous object visible?\n"
    "- threat_level: \"low\", \"medium\" or \"high\"\n"
    "- details: one short sentence describing what you see\n"
    "Reply with JSON only.";

const char* kThreatSchema = R"({
  "type": "object",
  "properties": {
    "face_detected": {"type": "boolean"},
    "angry_face": {"type": "boolean"},
    "dangerous_object": {"type": "boolean"},
    "threat_level": {"type": "string", "enum": ["low", "medium", "high"]},
    "details": {"type": "string"}
  },
  "required": ["face_detected", "angry_face", "dangerous_object", "threat_level", "details"]
})";

} // namespace

Result<VisionSchema> parse_vision_reply(const std::string& reply) {
    json j;
    try {
        j = json::parse(reply);
    } catch (const json::exception&) {
        auto object = utils::extract_json_object(reply);
        if (!object) {
            return make_error(ErrorType::VisionFailure, "No JSON object in vision reply");
        }
        try {
            j = json::parse(*object);
        } catch (const json::exception& e) {
            return make_error(ErrorType::VisionFailure, std::string("Invalid vision JSON: ") + e.what());
        }
    }
    if (!j.is_object()) {
        return make_error(ErrorType::VisionFailure, "Vision reply is not an object");
    }
    return VisionSchema::from_json(j);
}

class OllamaImageClassifier::Impl {
public:
    explicit Impl(const LLMConfig& config) : client_(config) {}
    LLMClient client_;
};

OllamaImageClassifier::OllamaImageClassifier(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

OllamaImageClassifier::~OllamaImageClassifier() = default;

Result<std::string> OllamaImageClassifier::classify(const std::string& image) {
    ChatRequest request;
    request.messages.push_back(Message::human(kThreatPrompt));
    request.images.push_back(image);
    request.format_json = kThreatSchema;
    return pimpl_->client_.chat(request);
}

} // namespace vision
} // namespace gate_sentry
