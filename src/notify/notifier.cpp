#include "notify/notifier.h"
#include "logger.h"

namespace gate_sentry {

NotifyResult LogNotifier::notify(const std::string& contact_name,
                                 const std::string& subject,
                                 const std::string& body) {
    auto email = directory_.email_for(contact_name);
    if (!email) {
        return {false, "No address on file for " + contact_name};
    }
    LOG_NOTIFY("To: " + *email + " | Subject: " + subject);
    Logger::debug("[Notify] " + body);
    return {true, "Logged notification for " + contact_name};
}

ArrivalNotice make_arrival_notice(const VisitorProfile& profile) {
    auto value_or = [](const FieldValue& v, const char* fallback) {
        return v.has_value() ? v.value() : std::string(fallback);
    };
    const std::string name = value_or(profile.name, "A visitor");
    const std::string contact = value_or(profile.contact_person, "there");

    ArrivalNotice notice;
    notice.subject = "Visitor Arrival Notification - " + value_or(profile.name, "Unknown visitor");
    notice.body =
        "Hello " + contact + ",\n\n"
        + name + " has arrived at the security gate and is here to see you.\n\n"
        "Visitor details:\n"
        "- Name: " + value_or(profile.name, "Not provided") + "\n"
        "- Purpose: " + value_or(profile.purpose, "Not provided") + "\n"
        "- Affiliation: " + value_or(profile.affiliation, "Not provided") + "\n"
        "- Status: Access Granted\n\n"
        "Please come to the main entrance to meet them.\n\n"
        "Security Gate System";
    return notice;
}

} // namespace gate_sentry
