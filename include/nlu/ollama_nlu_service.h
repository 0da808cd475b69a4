#pragma once

#include "config.h"
#include "directory/contact_directory.h"
#include "nlu/nlu_service.h"
#include <memory>

namespace gate_sentry {

/**
 * @brief NluService backed by local Ollama models, one client per role
 */
class OllamaNluService : public NluService {
public:
    /**
     * @param models Per-role model settings
     * @param contacts Known contacts, listed in the contact-person prompt
     */
    OllamaNluService(const ModelsConfig& models, const ContactDirectory& contacts);
    ~OllamaNluService() override;

    OllamaNluService(const OllamaNluService&) = delete;
    OllamaNluService& operator=(const OllamaNluService&) = delete;

    Result<InputRelevance> classify_input(const std::string& user_input) override;
    Result<VisitorChange> detect_visitor_change(const std::vector<Message>& recent) override;
    Result<std::string> extract_field(ProfileField field, const std::string& transcript) override;
    Result<std::string> summarize(const std::string& transcript) override;
    Result<std::string> classify_decision(const VisitorProfile& profile,
                                          const std::string& recent_transcript) override;

    /// Map a free-text relevance answer; unclear answers count as valid
    static InputRelevance interpret_relevance(const std::string& answer);

    /// Map a free-text same/new answer; only an unambiguous "new" counts
    static VisitorChange interpret_visitor_change(const std::string& answer);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace gate_sentry
