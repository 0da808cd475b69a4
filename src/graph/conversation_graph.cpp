#include "graph/conversation_graph.h"
#include "core/constants.h"
#include "directory/contact_directory.h"
#include "directory/employee_registry.h"
#include "graph/field_extractor.h"
#include "logger.h"
#include "memory/history_compactor.h"
#include "utils.h"
#include <algorithm>
#include <stdexcept>

namespace gate_sentry {

const char* node_name(GraphNode node) {
    switch (node) {
        case GraphNode::ReceiveInput: return "ReceiveInput";
        case GraphNode::Validate: return "Validate";
        case GraphNode::RouteAfterInput: return "RouteAfterInput";
        case GraphNode::Reset: return "Reset";
        case GraphNode::Compact: return "Compact";
        case GraphNode::ExtractProfile: return "ExtractProfile";
        case GraphNode::ValidateContact: return "ValidateContact";
        case GraphNode::AskQuestion: return "AskQuestion";
        case GraphNode::Decide: return "Decide";
        case GraphNode::Notify: return "Notify";
        case GraphNode::ResetForNextVisitor: return "ResetForNextVisitor";
        case GraphNode::End: return "End";
    }
    return "Unknown";
}

bool TurnResult::visited(GraphNode node) const {
    return std::find(trace.begin(), trace.end(), node) != trace.end();
}

GraphNode ConversationGraph::transition(GraphNode current,
                                        const SessionState& state,
                                        const TurnContext& ctx,
                                        const DialogConfig& config) {
    switch (current) {
        case GraphNode::ReceiveInput:
            return state.invalid_input ? GraphNode::End : GraphNode::Validate;

        case GraphNode::Validate:
            return GraphNode::RouteAfterInput;

        case GraphNode::RouteAfterInput:
            if (state.invalid_input) return GraphNode::End;
            if (!state.session_active) return GraphNode::Reset;
            if (state.vision_schema && state.vision_schema->is_high_threat()) return GraphNode::Decide;
            if (ctx.visitor_change == VisitorChange::New) return GraphNode::Reset;
            if (state.human_message_count() > config.max_human_messages) return GraphNode::Compact;
            return GraphNode::ExtractProfile;

        case GraphNode::Reset:
            return ctx.reset_reason == ResetReason::Inactive ? GraphNode::End : GraphNode::ExtractProfile;

        case GraphNode::Compact:
            return GraphNode::ExtractProfile;

        case GraphNode::ExtractProfile:
            return GraphNode::ValidateContact;

        case GraphNode::ValidateContact:
            if (state.visitor_profile.is_complete() || state.visitor_profile.authenticated) {
                return GraphNode::Decide;
            }
            return GraphNode::AskQuestion;

        case GraphNode::AskQuestion:
            return GraphNode::End;

        case GraphNode::Decide:
            if (ctx.decision && ctx.decision->decision == Decision::AllowRequest &&
                state.visitor_profile.contact_person.has_value()) {
                return GraphNode::Notify;
            }
            return GraphNode::ResetForNextVisitor;

        case GraphNode::Notify:
            return GraphNode::ResetForNextVisitor;

        case GraphNode::ResetForNextVisitor:
        case GraphNode::End:
            return GraphNode::End;
    }
    return GraphNode::End;
}

class ConversationGraph::Impl {
public:
    Impl(const DialogConfig& config, NluService& nlu, const ContactDirectory& contacts,
         const EmployeeRegistry& employees, Notifier& notifier)
        : config_(config),
          nlu_(nlu),
          contacts_(contacts),
          notifier_(notifier),
          extractor_(nlu),
          decision_engine_(nlu, employees),
          compactor_(memory::make_history_compactor(config, nlu)) {}

    TurnResult run_turn(SessionState& state, const std::string& user_input) {
        TurnContext ctx;
        state.user_input = user_input;

        GraphNode node = GraphNode::ReceiveInput;
        int steps = 0;
        while (node != GraphNode::End) {
            if (++steps > constants::dialog::MAX_TURN_STEPS) {
                Logger::error("[Graph] Step limit reached in session " + state.session_id +
                              " at node " + node_name(node));
                break;
            }
            ctx.trace.push_back(node);
            LOG_TRACE(state.session_id, node_name(node), "");
            execute(node, state, ctx);
            node = transition(node, state, ctx, config_);
        }

        TurnResult result;
        result.response = ctx.response;
        result.agent_messages = ctx.agent_messages;
        result.invalid_input = state.invalid_input;
        result.trace = ctx.trace;
        if (ctx.decision) {
            result.session_complete = true;
            result.decision = ctx.decision->decision;
            result.confidence = ctx.decision->confidence;
            result.reasoning = ctx.decision->reasoning;
            result.profile = ctx.decided_profile;
        } else {
            result.profile = state.visitor_profile;
        }
        result.notification_sent = ctx.notification && ctx.notification->success;
        return result;
    }

private:
    void execute(GraphNode node, SessionState& state, TurnContext& ctx) {
        try {
            switch (node) {
                case GraphNode::ReceiveInput: receive_input(state, ctx); break;
                case GraphNode::Validate: validate(state, ctx); break;
                case GraphNode::RouteAfterInput: route_after_input(state, ctx); break;
                case GraphNode::Reset: reset(state, ctx); break;
                case GraphNode::Compact: compact(state); break;
                case GraphNode::ExtractProfile: extract_profile(state, ctx); break;
                case GraphNode::ValidateContact: validate_contact_node(state, ctx); break;
                case GraphNode::AskQuestion: ask_question(state, ctx); break;
                case GraphNode::Decide: decide(state, ctx); break;
                case GraphNode::Notify: notify(state, ctx); break;
                case GraphNode::ResetForNextVisitor: reset_for_next_visitor(state); break;
                case GraphNode::End: break;
            }
        } catch (const std::exception& e) {
            // Node leaves state as it was; the transition still picks a valid next node
            Logger::error(std::string("[Graph] ") + node_name(node) + " failed in session " +
                          state.session_id + ": " + e.what());
        }
    }

    void say(SessionState& state, TurnContext& ctx, const std::string& text) {
        state.messages.push_back(Message::agent(text));
        ctx.agent_messages.push_back(text);
        ctx.response = text;
    }

    void receive_input(SessionState& state, TurnContext& ctx) {
        state.invalid_input = utils::is_empty_or_whitespace(state.user_input);
        if (state.invalid_input) {
            ctx.response = config_.reprompt;
        }
    }

    void validate(SessionState& state, TurnContext& ctx) {
        const std::string input = utils::trim_copy(state.user_input);
        auto relevance = nlu_.classify_input(input);
        if (!relevance) {
            Logger::warn("[Graph] Input validation failed, accepting input: " + relevance.error().message);
        } else if (relevance.value() == InputRelevance::Unrelated) {
            LOG_GRAPH("Unrelated input in session " + state.session_id + ": \"" + input + "\"");
            state.invalid_input = true;
            ctx.response = config_.reprompt;
            return;
        }
        state.messages.push_back(Message::human(input));
    }

    void route_after_input(SessionState& state, TurnContext& ctx) {
        // Checks ahead of new-visitor detection short-circuit the model call
        if (state.invalid_input || !state.session_active) return;
        if (state.vision_schema && state.vision_schema->is_high_threat()) return;
        if (state.human_message_count() < 2) return;

        std::vector<Message> recent;
        size_t n = constants::dialog::VISITOR_CHANGE_CONTEXT;
        size_t from = state.messages.size() > n ? state.messages.size() - n : 0;
        recent.assign(state.messages.begin() + from, state.messages.end());

        auto change = nlu_.detect_visitor_change(recent);
        if (!change) {
            Logger::warn("[Graph] Visitor change detection failed, assuming same visitor: " +
                         change.error().message);
            ctx.visitor_change = VisitorChange::Same;
            return;
        }
        ctx.visitor_change = change.value();
    }

    void reset(SessionState& state, TurnContext& ctx) {
        ctx.reset_reason = state.session_active ? ResetReason::NewVisitor : ResetReason::Inactive;

        std::optional<Message> trigger;
        if (!state.messages.empty() && state.messages.back().role == MessageRole::Human) {
            trigger = state.messages.back();
        }
        state.reset_conversation();
        if (trigger) {
            state.messages.push_back(*trigger);
        }

        if (ctx.reset_reason == ResetReason::Inactive) {
            LOG_GRAPH("Session " + state.session_id + " inactive, conversation reset");
            ctx.response = config_.reposition_prompt;
        } else {
            LOG_GRAPH("New visitor detected in session " + state.session_id);
        }
    }

    void compact(SessionState& state) {
        state.messages = compactor_->compact(state.messages);
    }

    void extract_profile(SessionState& state, TurnContext& ctx) {
        ExtractionOutcome outcome = extractor_.extract(state.visitor_profile, state.messages);
        ctx.contact_candidate = outcome.contact_candidate;
    }

    void validate_contact_node(SessionState& state, TurnContext& ctx) {
        validate_contact(state.visitor_profile, contacts_, ctx.contact_candidate);
        check_completeness(state.visitor_profile);
    }

    void ask_question(SessionState& state, TurnContext& ctx) {
        say(state, ctx, intake_question(state.visitor_profile, contacts_, config_.fallback_question));
    }

    void decide(SessionState& state, TurnContext& ctx) {
        DecisionOutcome outcome = decision_engine_.decide(state);
        state.decision = outcome.decision;
        state.decision_confidence = outcome.confidence;
        state.decision_reasoning = outcome.reasoning;
        ctx.decision = outcome;
        ctx.decided_profile = state.visitor_profile;

        LOG_GRAPH("Session " + state.session_id + " decision " + decision_name(outcome.decision) +
                  " (confidence " + std::to_string(outcome.confidence) + "): " + outcome.reasoning);
        say(state, ctx, outcome.message);
    }

    void notify(SessionState& state, TurnContext& ctx) {
        const std::string contact = state.visitor_profile.contact_person.value();
        ArrivalNotice notice = make_arrival_notice(state.visitor_profile);
        NotifyResult result = notifier_.notify(contact, notice.subject, notice.body);
        ctx.notification = result;

        if (result.success) {
            say(state, ctx, "Notification sent to " + contact + " about your arrival.");
        } else {
            Logger::warn("[Graph] Notification to " + contact + " failed: " + result.message);
            say(state, ctx, "Could not send notification to " + contact + ". Please contact them directly.");
        }
    }

    void reset_for_next_visitor(SessionState& state) {
        state.reset_conversation();
        LOG_GRAPH("Session " + state.session_id + " ready for next visitor");
    }

    DialogConfig config_;
    NluService& nlu_;
    const ContactDirectory& contacts_;
    Notifier& notifier_;
    FieldExtractor extractor_;
    DecisionEngine decision_engine_;
    std::unique_ptr<memory::HistoryCompactor> compactor_;
};

ConversationGraph::ConversationGraph(const DialogConfig& config,
                                     NluService& nlu,
                                     const ContactDirectory& contacts,
                                     const EmployeeRegistry& employees,
                                     Notifier& notifier)
    : pimpl_(std::make_unique<Impl>(config, nlu, contacts, employees, notifier)) {}

ConversationGraph::~ConversationGraph() = default;

TurnResult ConversationGraph::run_turn(SessionState& state, const std::string& user_input) {
    return pimpl_->run_turn(state, user_input);
}

} // namespace gate_sentry
