/**
 * Decision engine and notification text.
 * Asserts:
 * - High vision threat wins over everything (call_security, confidence 1.0).
 * - Authenticated employees are allowed only through doors they hold.
 * - Classifier replies are parsed strictly; any malformed or failed reply is deny_request / 0.0.
 * - Arrival notices and SMTP payloads carry the visitor details.
 *
 * Run from build dir: ./test_decision_engine
 */

#include "directory/contact_directory.h"
#include "directory/employee_registry.h"
#include "graph/decision_engine.h"
#include "notify/notifier.h"
#include "notify/smtp_notifier.h"
#include "session/session_state.h"
#include "fakes.h"
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace gate_sentry;
using gate_sentry::testing::FakeNlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static SessionState complete_session() {
    SessionState state = SessionState::create("d1", "preamble", true);
    state.visitor_profile.set_if_absent(ProfileField::Name, "Alice Walker");
    state.visitor_profile.set_if_absent(ProfileField::Purpose, "quarterly review");
    state.visitor_profile.set_if_absent(ProfileField::ContactPerson, "David Smith");
    state.visitor_profile.set_if_absent(ProfileField::ThreatLevel, "none");
    state.visitor_profile.set_if_absent(ProfileField::Affiliation, "Acme Corp");
    state.messages.push_back(Message::human("Alice Walker from Acme Corp to see David Smith"));
    return state;
}

int main() {
    // --- parse_decision_reply ---
    auto ok = parse_decision_reply(R"({"decision": "call_security", "confidence": 0.65, "reasoning": "vague purpose"})");
    ASSERT(ok.is_ok());
    ASSERT(ok.value().decision == Decision::CallSecurity);
    ASSERT(ok.value().confidence == 0.65);
    ASSERT(ok.value().reasoning == "vague purpose");

    auto wrapped = parse_decision_reply("<think>checking</think>Here you go: {\"decision\": \"deny_request\", \"confidence\": 1}");
    ASSERT(wrapped.is_ok());
    ASSERT(wrapped.value().decision == Decision::DenyRequest);

    const std::vector<std::string> malformed = {
        "",
        "allow",
        "{not json}",
        R"({"confidence": 0.9})",
        R"({"decision": "maybe", "confidence": 0.9})",
        R"({"decision": "allow_request"})",
        R"({"decision": "allow_request", "confidence": "high"})",
        R"({"decision": "allow_request", "confidence": 1.5})",
        R"({"decision": "allow_request", "confidence": -0.1})",
        R"({"decision": "none", "confidence": 0.5})",
    };
    for (const auto& reply : malformed) {
        auto parsed = parse_decision_reply(reply);
        ASSERT(parsed.is_error());
        if (parsed.is_error()) {
            ASSERT(parsed.error().type == ErrorType::DecisionParseFailure);
        }
    }

    // --- classifier path ---
    EmployeeRegistry no_employees;
    {
        FakeNlu nlu;
        DecisionEngine engine(nlu, no_employees);
        SessionState state = complete_session();

        DecisionOutcome allowed = engine.decide(state);
        ASSERT(allowed.decision == Decision::AllowRequest);
        ASSERT(allowed.message == decision_message(Decision::AllowRequest));
        ASSERT(nlu.decision_calls == 1);

        for (const auto& reply : malformed) {
            nlu.decision_reply = reply;
            DecisionOutcome closed = engine.decide(state);
            ASSERT(closed.decision == Decision::DenyRequest);
            ASSERT(closed.confidence == 0.0);
        }

        nlu.fail_decision = true;
        DecisionOutcome offline = engine.decide(state);
        ASSERT(offline.decision == Decision::DenyRequest);
        ASSERT(offline.confidence == 0.0);
        ASSERT(offline.message.find("contact reception") != std::string::npos);
    }

    // --- high threat wins ---
    {
        FakeNlu nlu;
        DecisionEngine engine(nlu, no_employees);
        SessionState state = SessionState::create("d2", "preamble", true);
        state.visitor_profile.authenticated = true;
        VisionSchema threat;
        threat.threat_level = ThreatLevel::High;
        threat.dangerous_object = true;
        state.vision_schema = threat;

        DecisionOutcome out = engine.decide(state);
        ASSERT(out.decision == Decision::CallSecurity);
        ASSERT(out.confidence == 1.0);
        ASSERT(nlu.decision_calls == 0);

        // Medium threat does not short-circuit
        state.vision_schema->threat_level = ThreatLevel::Medium;
        state.visitor_profile.authenticated = false;
        engine.decide(state);
        ASSERT(nlu.decision_calls == 1);
    }

    // --- authenticated employees ---
    {
        std::vector<Employee> staff;
        staff.push_back({"Dana Lee", "Welcome back, Dana.", {"gate-1", "lab-2"}});
        EmployeeRegistry registry(staff);
        ASSERT(registry.find("dana lee").has_value());
        ASSERT(registry.is_authorized("Dana Lee", "lab-2"));
        ASSERT(!registry.is_authorized("Dana Lee", "vault"));

        FakeNlu nlu;
        DecisionEngine engine(nlu, registry);
        SessionState state = SessionState::create("d3", "preamble", true);
        state.visitor_profile.authenticated = true;
        state.visitor_profile.set_if_absent(ProfileField::Name, "Dana Lee");
        state.camera_id = "gate-1";

        DecisionOutcome welcome = engine.decide(state);
        ASSERT(welcome.decision == Decision::AllowRequest);
        ASSERT(welcome.message == "Welcome back, Dana.");
        ASSERT(nlu.decision_calls == 0);

        state.camera_id = "vault";
        DecisionOutcome refused = engine.decide(state);
        ASSERT(refused.decision == Decision::DenyRequest);
        ASSERT(refused.message.find("not authorized") != std::string::npos);

        SessionState stranger = SessionState::create("d4", "preamble", true);
        stranger.visitor_profile.authenticated = true;
        stranger.visitor_profile.set_if_absent(ProfileField::Name, "Eve");
        stranger.camera_id = "gate-1";
        ASSERT(engine.decide(stranger).decision == Decision::DenyRequest);
    }

    // --- notifications ---
    {
        SessionState state = complete_session();
        ArrivalNotice notice = make_arrival_notice(state.visitor_profile);
        ASSERT(notice.subject == "Visitor Arrival Notification - Alice Walker");
        ASSERT(notice.body.find("- Purpose: quarterly review") != std::string::npos);
        ASSERT(notice.body.find("- Affiliation: Acme Corp") != std::string::npos);
        ASSERT(notice.body.find("Status: Access Granted") != std::string::npos);

        std::map<std::string, std::string> contacts = {{"David Smith", "david.smith@example.com"}};
        ContactDirectory directory(contacts);
        LogNotifier log_notifier(directory);
        ASSERT(log_notifier.notify("David Smith", notice.subject, notice.body).success);
        ASSERT(!log_notifier.notify("Nobody", notice.subject, notice.body).success);

        std::string payload = SmtpNotifier::build_payload("gate@example.com", "david.smith@example.com",
                                                          notice.subject, "line one\nline two");
        ASSERT(payload.find("To: <david.smith@example.com>\r\n") != std::string::npos);
        ASSERT(payload.find("Subject: Visitor Arrival Notification - Alice Walker\r\n") != std::string::npos);
        ASSERT(payload.find("line one\r\nline two") != std::string::npos);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All decision engine tests passed.\n";
    return 0;
}
