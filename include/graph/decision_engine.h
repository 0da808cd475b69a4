#pragma once

/**
 * @file decision_engine.h
 * @brief Access decision: vision override, employee door check, classifier
 */

#include "directory/employee_registry.h"
#include "session/session_state.h"
#include <string>

namespace gate_sentry {

class NluService;

/**
 * @brief A decision plus the line spoken to the visitor
 */
struct DecisionOutcome {
    Decision decision = Decision::DenyRequest;
    double confidence = 0.0;
    std::string reasoning;
    std::string message;
};

/**
 * @brief Parsed classifier reply
 */
struct ClassifiedDecision {
    Decision decision = Decision::DenyRequest;
    double confidence = 0.0;
    std::string reasoning;
};

/**
 * @brief Parse {"decision", "confidence", "reasoning"} from a classifier reply
 *
 * Accepts a JSON object embedded in surrounding text.
 * @return DecisionParseFailure for malformed JSON, unknown decisions or a
 *         confidence outside [0, 1]
 */
Result<ClassifiedDecision> parse_decision_reply(const std::string& reply);

/// Fixed visitor-facing line for a decision
const char* decision_message(Decision decision);

/**
 * @brief Decides access for a session
 *
 * Priority:
 * 1. vision threat_level high -> call_security
 * 2. authenticated -> allow if the employee may use this door, else deny
 * 3. classifier over profile + recent transcript; any failure -> deny, confidence 0
 */
class DecisionEngine {
public:
    DecisionEngine(NluService& nlu, const EmployeeRegistry& employees)
        : nlu_(nlu), employees_(employees) {}

    DecisionOutcome decide(const SessionState& state);

private:
    DecisionOutcome decide_authenticated(const SessionState& state) const;

    NluService& nlu_;
    const EmployeeRegistry& employees_;
};

} // namespace gate_sentry
