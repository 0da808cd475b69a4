#pragma once

/**
 * @file conversation_graph.h
 * @brief Per-turn screening state machine
 *
 * One call to run_turn() walks the graph from ReceiveInput to End:
 *
 *   ReceiveInput -> Validate -> RouteAfterInput
 *   RouteAfterInput -> End                    (invalid input)
 *                   -> Reset                  (session inactive / new visitor)
 *                   -> Decide                 (vision threat high)
 *                   -> Compact                (too many human messages)
 *                   -> ExtractProfile
 *   Reset           -> End                    (inactive: ask visitor to face camera)
 *                   -> ExtractProfile         (new visitor)
 *   Compact -> ExtractProfile -> ValidateContact
 *   ValidateContact -> Decide                 (complete or authenticated)
 *                   -> AskQuestion -> End
 *   Decide -> Notify -> ResetForNextVisitor -> End
 *          -> ResetForNextVisitor -> End
 *
 * Node handlers perform side effects; transition() is a pure function of
 * the node, the session state and the turn context.
 */

#include "config.h"
#include "graph/decision_engine.h"
#include "nlu/nlu_service.h"
#include "notify/notifier.h"
#include "session/session_state.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gate_sentry {

class ContactDirectory;
class EmployeeRegistry;

enum class GraphNode {
    ReceiveInput,
    Validate,
    RouteAfterInput,
    Reset,
    Compact,
    ExtractProfile,
    ValidateContact,
    AskQuestion,
    Decide,
    Notify,
    ResetForNextVisitor,
    End
};

const char* node_name(GraphNode node);

enum class ResetReason {
    None,
    Inactive,
    NewVisitor
};

/**
 * @brief Facts gathered while a turn runs
 */
struct TurnContext {
    VisitorChange visitor_change = VisitorChange::Same;
    ResetReason reset_reason = ResetReason::None;
    std::optional<std::string> contact_candidate;
    std::optional<DecisionOutcome> decision;
    std::optional<NotifyResult> notification;
    VisitorProfile decided_profile;      ///< Profile as it was when decided
    std::vector<std::string> agent_messages;
    std::string response;
    std::vector<GraphNode> trace;
};

/**
 * @brief What the caller gets back from one turn
 */
struct TurnResult {
    std::string response;                     ///< Line to show the visitor
    std::vector<std::string> agent_messages;  ///< Every agent line added this turn
    bool invalid_input = false;
    bool session_complete = false;            ///< A decision cycle finished
    Decision decision = Decision::None;
    double confidence = 0.0;
    std::string reasoning;
    bool notification_sent = false;
    VisitorProfile profile;                   ///< Pre-reset profile when complete
    std::vector<GraphNode> trace;

    bool visited(GraphNode node) const;
};

/**
 * @brief Runs screening turns against a SessionState
 *
 * Holds no per-session data; one instance serves every session. Callers
 * must not run two turns for the same session concurrently.
 */
class ConversationGraph {
public:
    ConversationGraph(const DialogConfig& config,
                      NluService& nlu,
                      const ContactDirectory& contacts,
                      const EmployeeRegistry& employees,
                      Notifier& notifier);
    ~ConversationGraph();

    ConversationGraph(const ConversationGraph&) = delete;
    ConversationGraph& operator=(const ConversationGraph&) = delete;

    /**
     * @brief Process one visitor line
     * @param state Session to mutate
     * @param user_input Raw text as typed or transcribed
     */
    TurnResult run_turn(SessionState& state, const std::string& user_input);

    /**
     * @brief Next node after `current` has executed
     */
    static GraphNode transition(GraphNode current,
                                const SessionState& state,
                                const TurnContext& ctx,
                                const DialogConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace gate_sentry
