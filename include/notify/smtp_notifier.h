#pragma once

#include "config.h"
#include "notify/notifier.h"

namespace gate_sentry {

/**
 * @brief Sends notifications as email through libcurl's SMTP support
 *
 * The account password is read from the environment variable named by
 * NotifyConfig::password_env at send time, never from the config file.
 */
class SmtpNotifier : public Notifier {
public:
    SmtpNotifier(const NotifyConfig& config, const ContactDirectory& directory);

    NotifyResult notify(const std::string& contact_name,
                        const std::string& subject,
                        const std::string& body) override;

    /**
     * @brief RFC 5322 message text (headers + body)
     */
    static std::string build_payload(const std::string& from, const std::string& to,
                                     const std::string& subject, const std::string& body);

private:
    NotifyConfig config_;
    const ContactDirectory& directory_;
};

} // namespace gate_sentry
