#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace autopilot::protocol {

    // What the backend asked for in one step, after parsing its free-form reply.
    struct ToolCallAction {
        std::string tool;
        nlohmann::json arguments;  // always an object
    };

    struct FinalAnswerAction {
        std::string text;
    };

    // No JSON object could be located in the reply.
    struct ReasoningFailure {
        std::string error;
    };

    // A JSON object was found but it is not a usable action.
    struct ParsingFailure {
        std::string error;
    };

    using Action = std::variant<ToolCallAction, FinalAnswerAction, ReasoningFailure,
                                ParsingFailure>;

} // namespace autopilot::protocol
