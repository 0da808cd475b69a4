/**
 * History compaction.
 * Asserts:
 * - Both strategies are no-ops below eight messages.
 * - At or above eight messages the output is always shorter than the input.
 * - The system preamble survives compaction and the newest messages are kept in order.
 * - A failed or empty summary leaves history unchanged.
 *
 * Run from build dir: ./test_history_compactor
 */

#include "config.h"
#include "memory/history_compactor.h"
#include "fakes.h"
#include <iostream>
#include <string>
#include <vector>

using namespace gate_sentry;
using gate_sentry::testing::FakeNlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::vector<Message> conversation(size_t total) {
    std::vector<Message> messages;
    messages.push_back(Message::system("You are a helpful assistant at the gate."));
    for (size_t i = 1; i < total; ++i) {
        std::string text = "line " + std::to_string(i);
        messages.push_back(i % 2 ? Message::human(text) : Message::agent(text));
    }
    return messages;
}

int main() {
    FakeNlu nlu;
    memory::ShortenCompactor shorten(8, 5);
    memory::SummarizeCompactor summarize(nlu, 8);

    // --- below threshold ---
    for (size_t n = 0; n < 8; ++n) {
        auto input = conversation(n == 0 ? 1 : n);
        ASSERT(shorten.compact(input) == input);
        ASSERT(summarize.compact(input) == input);
    }

    // --- shorten ---
    for (size_t n = 8; n <= 30; ++n) {
        auto input = conversation(n);
        auto output = shorten.compact(input);
        ASSERT(output.size() < input.size());
        ASSERT(output.front() == input.front());
        ASSERT(output.back() == input.back());
    }

    auto long_input = conversation(20);
    auto shortened = shorten.compact(long_input);
    ASSERT(shortened.size() == 7);
    ASSERT(shortened[1].role == MessageRole::System);
    ASSERT(shortened[1].content.find("[Earlier conversation shortened:") == 0);
    ASSERT(shortened[2] == long_input[15]);

    // Small inputs keep fewer than five so the result still shrinks
    auto eight = conversation(8);
    auto eight_out = shorten.compact(eight);
    ASSERT(eight_out.size() == 7);

    // --- summarize ---
    for (size_t n = 8; n <= 30; ++n) {
        auto input = conversation(n);
        auto output = summarize.compact(input);
        ASSERT(output.size() < input.size());
        ASSERT(output.front() == input.front());
        ASSERT(output.back() == input.back());
    }

    auto summarized = summarize.compact(long_input);
    ASSERT(summarized.size() == 6);
    ASSERT(summarized[1].content == "[CONVERSATION SUMMARY: Visitor gave partial details.]");
    ASSERT(summarized[2] == long_input[16]);

    nlu.fail_summary = true;
    ASSERT(summarize.compact(long_input) == long_input);
    nlu.fail_summary = false;
    nlu.summary = "   ";
    ASSERT(summarize.compact(long_input) == long_input);

    // --- factory ---
    DialogConfig dialog;
    dialog.history_mode = "shorten";
    auto from_config = memory::make_history_compactor(dialog, nlu);
    ASSERT(std::string(from_config->name()) == "shorten");
    dialog.history_mode = "summarize";
    ASSERT(std::string(memory::make_history_compactor(dialog, nlu)->name()) == "summarize");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All history compactor tests passed.\n";
    return 0;
}
