#pragma once

#include <optional>
#include <string>
#include "protocol/action_contract.hpp"

namespace autopilot::runtime {

// Locates one JSON object in free-form model output: the object inside a
// ```json fence wins, otherwise the first balanced {...} in the text.
std::optional<std::string> extract_json_object(const std::string& text);

// Turns model output into an Action. Never throws.
//  - no object found                          -> ReasoningFailure
//  - object is not valid JSON / has bad shape -> ParsingFailure
//  - {"action": {...}} is unwrapped one level
//  - "final_answer" present                   -> FinalAnswerAction
//  - "tool" (string) + "arguments" (object)   -> ToolCallAction
protocol::Action parse_action(const std::string& response);

}  // namespace autopilot::runtime
