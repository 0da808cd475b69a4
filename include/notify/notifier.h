#pragma once

/**
 * @file notifier.h
 * @brief Contact notification interface
 */

#include "directory/contact_directory.h"
#include "session/visitor_profile.h"
#include <string>

namespace gate_sentry {

struct NotifyResult {
    bool success = false;
    std::string message;
};

/**
 * @brief Delivers a message to a named internal contact
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    /**
     * @param contact_name Canonical directory name
     */
    virtual NotifyResult notify(const std::string& contact_name,
                                const std::string& subject,
                                const std::string& body) = 0;
};

/**
 * @brief Writes notifications to the log instead of sending them
 *
 * Still requires the contact to be in the directory.
 */
class LogNotifier : public Notifier {
public:
    explicit LogNotifier(const ContactDirectory& directory) : directory_(directory) {}

    NotifyResult notify(const std::string& contact_name,
                        const std::string& subject,
                        const std::string& body) override;

private:
    const ContactDirectory& directory_;
};

/**
 * @brief Subject and body announcing a visitor to their contact
 */
struct ArrivalNotice {
    std::string subject;
    std::string body;
};

ArrivalNotice make_arrival_notice(const VisitorProfile& profile);

} // namespace gate_sentry
