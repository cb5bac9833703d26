#pragma once

#include <string>

namespace autopilot::context {

// Prompt text with {task}, {tools} and {history} slots. {history} must appear
// exactly once, surrounded by whitespace.
struct PromptTemplate {
    std::string text;

    static PromptTemplate standard();

    // Fixed prompt used when even the history-free prompt exceeds the ceiling.
    static std::string minimal();
};

struct RenderedFrame {
    std::string before_history;
    std::string after_history;
};

// Substitutes task and tools and splits the result at the history slot.
RenderedFrame render_frame(const PromptTemplate& prompt_template, const std::string& task,
                           const std::string& tool_hints);

}  // namespace autopilot::context
