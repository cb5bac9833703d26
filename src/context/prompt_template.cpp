#include "context/prompt_template.hpp"

namespace autopilot::context {

namespace {

constexpr const char* kTaskSlot = "{task}";
constexpr const char* kToolsSlot = "{tools}";
constexpr const char* kHistorySlot = "{history}";

void replace_all(std::string& text, const std::string& slot, const std::string& value) {
    std::size_t pos = text.find(slot);
    while (pos != std::string::npos) {
        text.replace(pos, slot.size(), value);
        pos = text.find(slot, pos + value.size());
    }
}

}  // namespace

PromptTemplate PromptTemplate::standard() {
    return PromptTemplate{
        "Autonomous tool-using assistant. Task: \"{task}\"\n"
        "\n"
        "Tools: {tools}\n"
        "\n"
        "History: {history}\n"
        "\n"
        "Work toward the task one tool call at a time. Read the history before acting:\n"
        "failed calls have an empty result, errors show what went wrong last time.\n"
        "\n"
        "Reply with exactly one JSON object and nothing else.\n"
        "Call a tool: {\"tool\": \"<tool name>\", \"arguments\": {\"method\": \"<method>\", "
        "\"params\": {}}}\n"
        "Finish: {\"final_answer\": \"<answer>\"}\n"
        "\n"
        "JSON response:"};
}

std::string PromptTemplate::minimal() {
    return "Autonomous tool-using assistant. Earlier context was cleared because it no longer "
           "fit.\n"
           "\n"
           "History: []\n"
           "\n"
           "Reply with exactly one JSON object and nothing else, either\n"
           "{\"tool\": \"<tool name>\", \"arguments\": {}} or {\"final_answer\": \"<answer>\"}.\n"
           "Do not wrap it in {\"action\": ...}.\n"
           "\n"
           "JSON response:";
}

RenderedFrame render_frame(const PromptTemplate& prompt_template, const std::string& task,
                           const std::string& tool_hints) {
    // Split first so that task or tool text containing "{history}" is left alone.
    const std::string& text = prompt_template.text;
    const std::size_t slot = text.find(kHistorySlot);

    RenderedFrame frame;
    if (slot == std::string::npos) {
        frame.before_history = text + "\n\nHistory: ";
        frame.after_history = "";
    } else {
        frame.before_history = text.substr(0, slot);
        frame.after_history = text.substr(slot + std::string(kHistorySlot).size());
    }

    for (std::string* part : {&frame.before_history, &frame.after_history}) {
        replace_all(*part, kTaskSlot, task);
        replace_all(*part, kToolsSlot, tool_hints);
    }
    return frame;
}

}  // namespace autopilot::context
