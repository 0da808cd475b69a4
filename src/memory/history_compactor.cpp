#include "memory/history_compactor.h"
#include "logger.h"
#include "nlu/nlu_service.h"
#include "session/session_state.h"
#include "utils.h"
#include <algorithm>

namespace gate_sentry {
namespace memory {

namespace {

bool has_preamble(const std::vector<Message>& messages) {
    return !messages.empty() && messages.front().role == MessageRole::System;
}

} // namespace

ShortenCompactor::ShortenCompactor(size_t min_messages, size_t keep_last)
    : min_messages_(std::max<size_t>(min_messages, 3)), keep_last_(std::max<size_t>(keep_last, 1)) {}

std::vector<Message> ShortenCompactor::compact(const std::vector<Message>& messages) {
    if (messages.size() < min_messages_) {
        return messages;
    }

    // Output is preamble + marker + tail, so the tail may hold at most size - 3
    size_t keep = std::min(keep_last_, messages.size() - 3);
    size_t tail_start = messages.size() - keep;
    size_t head = has_preamble(messages) ? 1 : 0;
    size_t removed = tail_start - head;

    std::vector<Message> out;
    if (head) out.push_back(messages.front());
    out.push_back(Message::system("[Earlier conversation shortened: " +
                                  std::to_string(removed) + " messages removed]"));
    out.insert(out.end(), messages.begin() + tail_start, messages.end());

    Logger::info("[Memory] Shortened history " + std::to_string(messages.size()) + " -> " +
                 std::to_string(out.size()) + " messages");
    return out;
}

SummarizeCompactor::SummarizeCompactor(NluService& nlu, size_t min_messages)
    : nlu_(nlu), min_messages_(std::max<size_t>(min_messages, constants::dialog::SUMMARIZE_KEEP_LAST + 3)) {}

std::vector<Message> SummarizeCompactor::compact(const std::vector<Message>& messages) {
    if (messages.size() < min_messages_) {
        return messages;
    }

    const size_t keep = constants::dialog::SUMMARIZE_KEEP_LAST;
    size_t head = has_preamble(messages) ? 1 : 0;
    size_t tail_start = messages.size() - keep;

    std::vector<Message> older(messages.begin() + head, messages.begin() + tail_start);
    auto summary = nlu_.summarize(format_transcript(older));
    if (!summary) {
        Logger::warn("[Memory] Summarization failed, keeping full history: " + summary.error().message);
        return messages;
    }
    std::string text = utils::trim_copy(summary.value());
    if (text.empty()) {
        Logger::warn("[Memory] Empty summary, keeping full history");
        return messages;
    }

    std::vector<Message> out;
    if (head) out.push_back(messages.front());
    out.push_back(Message::system("[CONVERSATION SUMMARY: " + text + "]"));
    out.insert(out.end(), messages.begin() + tail_start, messages.end());

    Logger::info("[Memory] Summarized history " + std::to_string(messages.size()) + " -> " +
                 std::to_string(out.size()) + " messages");
    return out;
}

std::unique_ptr<HistoryCompactor> make_history_compactor(const DialogConfig& config, NluService& nlu) {
    if (config.history_mode == "shorten") {
        return std::make_unique<ShortenCompactor>(config.compact_min_messages, config.shorten_keep_last);
    }
    return std::make_unique<SummarizeCompactor>(nlu, config.compact_min_messages);
}

} // namespace memory
} // namespace gate_sentry
