#include "runtime/action_parser.hpp"

#include <cctype>
#include <nlohmann/json.hpp>

namespace autopilot::runtime {

using nlohmann::json;
using protocol::Action;
using protocol::FinalAnswerAction;
using protocol::ParsingFailure;
using protocol::ReasoningFailure;
using protocol::ToolCallAction;

namespace {

constexpr const char* kJsonFence = "```json";
constexpr const char* kFence = "```";

// Returns the end (one past the closing brace) of the object starting at `open`,
// skipping braces inside string literals.
std::optional<std::size_t> balanced_end(const std::string& text, const std::size_t open,
                                        const std::size_t limit) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = open; i < limit; ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> first_object_in(const std::string& text, const std::size_t begin,
                                           const std::size_t limit) {
    std::size_t open = text.find('{', begin);
    while (open != std::string::npos && open < limit) {
        const auto end = balanced_end(text, open, limit);
        if (end.has_value()) {
            return text.substr(open, end.value() - open);
        }
        open = text.find('{', open + 1);
    }
    return std::nullopt;
}

std::optional<std::string> fenced_object(const std::string& text) {
    std::size_t fence = text.find(kJsonFence);
    while (fence != std::string::npos) {
        const std::size_t body = fence + std::string(kJsonFence).size();
        std::size_t close = text.find(kFence, body);
        if (close == std::string::npos) {
            close = text.size();
        }
        std::size_t first = body;
        while (first < close && std::isspace(static_cast<unsigned char>(text[first])) != 0) {
            ++first;
        }
        if (first < close && text[first] == '{') {
            auto object = first_object_in(text, first, close);
            if (object.has_value()) {
                return object;
            }
        }
        fence = text.find(kJsonFence, body);
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> extract_json_object(const std::string& text) {
    auto fenced = fenced_object(text);
    if (fenced.has_value()) {
        return fenced;
    }
    return first_object_in(text, 0, text.size());
}

Action parse_action(const std::string& response) {
    const auto object_text = extract_json_object(response);
    if (!object_text.has_value()) {
        return ReasoningFailure{"No JSON object found"};
    }

    json action = json::parse(object_text.value(), nullptr, false);
    if (action.is_discarded() || !action.is_object()) {
        return ParsingFailure{"Invalid JSON in action: " + object_text.value()};
    }

    const auto envelope = action.find("action");
    if (envelope != action.end() && envelope->is_object()) {
        json inner = *envelope;
        action = std::move(inner);
    }

    const auto final_answer = action.find("final_answer");
    if (final_answer != action.end()) {
        return FinalAnswerAction{final_answer->is_string() ? final_answer->get<std::string>()
                                                           : final_answer->dump()};
    }

    const auto tool = action.find("tool");
    const auto arguments = action.find("arguments");
    if (tool == action.end() || !tool->is_string() || tool->get<std::string>().empty()) {
        return ParsingFailure{"Invalid tool call structure: missing tool name"};
    }
    if (arguments == action.end() || !arguments->is_object()) {
        return ParsingFailure{"Invalid tool call structure: arguments must be an object"};
    }
    return ToolCallAction{tool->get<std::string>(), *arguments};
}

}  // namespace autopilot::runtime
