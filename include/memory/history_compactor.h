#pragma once

/**
 * @file history_compactor.h
 * @brief Strategies that shrink a long session transcript
 *
 * Both strategies:
 * - leave transcripts shorter than min_messages untouched
 * - keep the leading system preamble
 * - return strictly fewer messages whenever they do act
 */

#include "config.h"
#include "core/types.h"
#include <memory>
#include <string>
#include <vector>

namespace gate_sentry {

class NluService;

namespace memory {

/**
 * @brief Abstract compaction strategy
 */
class HistoryCompactor {
public:
    virtual ~HistoryCompactor() = default;

    /**
     * @brief Compact a transcript
     * @return New transcript, or a copy of the input when nothing changed
     */
    virtual std::vector<Message> compact(const std::vector<Message>& messages) = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Keep preamble + marker + last N messages; no external calls
 */
class ShortenCompactor : public HistoryCompactor {
public:
    ShortenCompactor(size_t min_messages, size_t keep_last);

    std::vector<Message> compact(const std::vector<Message>& messages) override;
    const char* name() const override { return "shorten"; }

private:
    size_t min_messages_;
    size_t keep_last_;
};

/**
 * @brief Keep preamble + summary of the older part + last 4 messages
 *
 * If summarization fails or comes back empty the transcript is returned
 * unchanged.
 */
class SummarizeCompactor : public HistoryCompactor {
public:
    SummarizeCompactor(NluService& nlu, size_t min_messages);

    std::vector<Message> compact(const std::vector<Message>& messages) override;
    const char* name() const override { return "summarize"; }

private:
    NluService& nlu_;
    size_t min_messages_;
};

/**
 * @brief Build the strategy named by dialog.history_mode
 */
std::unique_ptr<HistoryCompactor> make_history_compactor(const DialogConfig& config, NluService& nlu);

} // namespace memory
} // namespace gate_sentry
