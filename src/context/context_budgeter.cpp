#include "context/context_budgeter.hpp"

#include <vector>
#include "context/token_estimator.hpp"
#include "core/logging/logger.hpp"

namespace autopilot::context {

namespace {

constexpr const char* kEmptyHistory = "[]";
constexpr const char* kArrayOpen = "[\n";
constexpr const char* kArrayClose = "\n]";
constexpr const char* kItemSeparator = ",\n";

// One history item dumped the way it sits inside the indented array: every line
// shifted right by one indent level.
std::string render_array_element(const protocol::HistoryItem& item) {
    const std::string dumped =
        protocol::to_json(item).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string shifted;
    shifted.reserve(dumped.size() + 64);
    shifted += "  ";
    for (const char c : dumped) {
        shifted.push_back(c);
        if (c == '\n') {
            shifted += "  ";
        }
    }
    return shifted;
}

std::string join_elements(const std::vector<std::string>& elements, const std::size_t first) {
    if (first >= elements.size()) {
        return kEmptyHistory;
    }
    std::string out = kArrayOpen;
    for (std::size_t i = first; i < elements.size(); ++i) {
        if (i != first) {
            out += kItemSeparator;
        }
        out += elements[i];
    }
    out += kArrayClose;
    return out;
}

}  // namespace

std::string render_history(const protocol::History& history) {
    std::vector<std::string> elements;
    elements.reserve(history.size());
    for (const auto& item : history) {
        elements.push_back(render_array_element(item));
    }
    return join_elements(elements, 0);
}

BudgetedPrompt build_prompt(const std::string& task, const std::string& tool_hints,
                            const protocol::History& history, const std::size_t token_ceiling,
                            const PromptTemplate& prompt_template) {
    const RenderedFrame frame = render_frame(prompt_template, task, tool_hints);
    const TextStats frame_stats = measure(frame.before_history) + measure(frame.after_history);

    BudgetedPrompt budgeted;
    const std::size_t baseline = estimate_tokens(frame_stats + measure(kEmptyHistory));
    if (baseline > token_ceiling) {
        budgeted.prompt = PromptTemplate::minimal();
        budgeted.forced_reset = true;
        budgeted.truncated = true;
        budgeted.kept_count = 0;
        budgeted.estimated_tokens = estimate_tokens(budgeted.prompt);
        LOG_WARN("Prompt without history needs " + std::to_string(baseline) + " tokens > " +
                 std::to_string(token_ceiling) + "; forced history reset, using minimal prompt");
        return budgeted;
    }

    std::vector<std::string> elements;
    elements.reserve(history.size());
    for (const auto& item : history) {
        elements.push_back(render_array_element(item));
    }

    // A non-empty block is "[\n" e1 ",\n" ... ek "\n]": the brackets are two words,
    // and every element brings its own counts plus two separator bytes.
    TextStats accepted = frame_stats;
    accepted.words += 2;
    accepted.bytes += 2;
    std::size_t first_kept = elements.size();
    while (first_kept > 0) {
        TextStats candidate = accepted + measure(elements[first_kept - 1]);
        candidate.bytes += 2;
        if (estimate_tokens(candidate) > token_ceiling) {
            break;
        }
        accepted = candidate;
        --first_kept;
    }

    // Check the arithmetic against the real string; this only drops more items when
    // a template breaks the whitespace rule around {history}.
    std::string history_block = join_elements(elements, first_kept);
    budgeted.prompt = frame.before_history + history_block + frame.after_history;
    budgeted.estimated_tokens = estimate_tokens(budgeted.prompt);
    while (budgeted.estimated_tokens > token_ceiling && first_kept < elements.size()) {
        ++first_kept;
        history_block = join_elements(elements, first_kept);
        budgeted.prompt = frame.before_history + history_block + frame.after_history;
        budgeted.estimated_tokens = estimate_tokens(budgeted.prompt);
    }

    budgeted.kept_count = elements.size() - first_kept;
    budgeted.truncated = budgeted.kept_count < history.size();

    LOG_INFO("Context window: " + std::to_string(token_ceiling) + " tokens max");
    LOG_INFO("Final prompt tokens: " + std::to_string(budgeted.estimated_tokens));
    LOG_INFO("History items included: " + std::to_string(budgeted.kept_count) + "/" +
             std::to_string(history.size()));
    return budgeted;
}

}  // namespace autopilot::context
