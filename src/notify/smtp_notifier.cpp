#include "notify/smtp_notifier.h"
#include "logger.h"
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <curl/curl.h>

namespace gate_sentry {

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = state->payload->size() - state->offset;
    size_t n = left < room ? left : room;
    if (n > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, n);
        state->offset += n;
    }
    return n;
}

std::string rfc2822_date() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);
    char out[64];
    std::strftime(out, sizeof(out), "%a, %d %b %Y %H:%M:%S +0000", &tm_buf);
    return out;
}

} // namespace

SmtpNotifier::SmtpNotifier(const NotifyConfig& config, const ContactDirectory& directory)
    : config_(config), directory_(directory) {
    if (config_.username.empty()) {
        config_.username = config_.sender_email;
    }
}

std::string SmtpNotifier::build_payload(const std::string& from, const std::string& to,
                                        const std::string& subject, const std::string& body) {
    std::string payload;
    payload += "Date: " + rfc2822_date() + "\r\n";
    payload += "To: <" + to + ">\r\n";
    payload += "From: <" + from + ">\r\n";
    payload += "Subject: " + subject + "\r\n";
    payload += "MIME-Version: 1.0\r\n";
    payload += "Content-Type: text/plain; charset=utf-8\r\n";
    payload += "\r\n";
    // Bare LF is not allowed in SMTP DATA
    for (char c : body) {
        if (c == '\n') payload += "\r\n";
        else payload += c;
    }
    payload += "\r\n";
    return payload;
}

NotifyResult SmtpNotifier::notify(const std::string& contact_name,
                                  const std::string& subject,
                                  const std::string& body) {
    auto email = directory_.email_for(contact_name);
    if (!email) {
        return {false, "No address on file for " + contact_name};
    }

    const char* password = std::getenv(config_.password_env.c_str());
    if (!password || !*password) {
        Logger::error("[Notify] " + config_.password_env + " is not set; cannot send email");
        return {false, "Email credentials not configured"};
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return {false, "Failed to initialize CURL"};
    }

    std::string payload = build_payload(config_.sender_email, *email, subject, body);
    UploadState upload{&payload, 0};
    std::string mail_from = "<" + config_.sender_email + ">";
    struct curl_slist* recipients = nullptr;
    recipients = curl_slist_append(recipients, ("<" + *email + ">").c_str());

    curl_easy_setopt(curl, CURLOPT_URL, config_.smtp_url.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_USERNAME, config_.username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, password);
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(constants::network::CONNECT_TIMEOUT_MS));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::error("[Notify] SMTP send to " + *email + " failed: " + curl_easy_strerror(res));
        return {false, curl_easy_strerror(res)};
    }

    LOG_NOTIFY("Email sent to " + contact_name + " <" + *email + ">");
    return {true, "Email sent to " + contact_name};
}

} // namespace gate_sentry
