#pragma once

/**
 * @file nlu_service.h
 * @brief Natural-language capability interface used by the conversation graph
 *
 * Every call may fail; callers degrade to the documented fallback.
 * Implementations: OllamaNluService (production), scripted fakes in tests.
 */

#include "core/types.h"
#include "errors.h"
#include "session/visitor_profile.h"
#include <string>
#include <vector>

namespace gate_sentry {

enum class InputRelevance {
    Valid,
    Unrelated
};

enum class VisitorChange {
    Same,
    New
};

/**
 * @brief Abstract NLU interface
 */
class NluService {
public:
    virtual ~NluService() = default;

    /**
     * @brief Is this line relevant to a gate visit?
     */
    virtual Result<InputRelevance> classify_input(const std::string& user_input) = 0;

    /**
     * @brief Does the latest message come from a different visitor?
     * @param recent Tail of the transcript, newest last
     */
    virtual Result<VisitorChange> detect_visitor_change(const std::vector<Message>& recent) = 0;

    /**
     * @brief Raw model answer for one profile field ("-1" when not stated)
     *
     * Cleaning and sentinel handling are done by the caller.
     */
    virtual Result<std::string> extract_field(ProfileField field, const std::string& transcript) = 0;

    /**
     * @brief Concise summary of an older transcript segment
     */
    virtual Result<std::string> summarize(const std::string& transcript) = 0;

    /**
     * @brief Raw classifier reply, expected to hold
     *        {"decision": ..., "confidence": ..., "reasoning": ...}
     */
    virtual Result<std::string> classify_decision(const VisitorProfile& profile,
                                                  const std::string& recent_transcript) = 0;
};

} // namespace gate_sentry
