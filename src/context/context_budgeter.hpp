#pragma once

#include <cstddef>
#include <string>
#include "context/prompt_template.hpp"
#include "protocol/history_record.hpp"

namespace autopilot::context {

// What to send and what to keep, decided together.
struct BudgetedPrompt {
    std::string prompt;
    // The caller must keep only the last kept_count history items.
    bool truncated = false;
    // Even the history-free prompt was over the ceiling; prompt is the fixed minimal one.
    bool forced_reset = false;
    std::size_t kept_count = 0;
    std::size_t estimated_tokens = 0;
};

// Builds the prompt holding the longest suffix of `history` whose estimate stays
// at or under `token_ceiling`. Items are taken newest first and kept in
// chronological order; the first item that does not fit stops the walk.
BudgetedPrompt build_prompt(const std::string& task, const std::string& tool_hints,
                            const protocol::History& history, std::size_t token_ceiling,
                            const PromptTemplate& prompt_template = PromptTemplate::standard());

// JSON array of items as it appears in the prompt (two-space indent).
std::string render_history(const protocol::History& history);

}  // namespace autopilot::context
