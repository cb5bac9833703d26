#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace autopilot::protocol {

struct ToolCallRecord {
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ReasoningErrorRecord {
    std::string raw_response;
    std::string error;
};

struct ParsingErrorRecord {
    std::string raw_response;
    std::string error;
};

struct EmergencyCorrectionRecord {
    std::string feedback;
};

struct GoalUpdatedRecord {
    std::string new_goal;
};

struct FinalAnswerProposedRecord {
    std::string text;
};

using ActionRecord = std::variant<ToolCallRecord, ReasoningErrorRecord, ParsingErrorRecord,
                                  EmergencyCorrectionRecord, GoalUpdatedRecord,
                                  FinalAnswerProposedRecord>;

// One entry of the run history. The result is whatever the other side returned,
// kept opaque.
struct HistoryItem {
    ActionRecord action;
    nlohmann::json result = nlohmann::json::object();

    static HistoryItem tool_call(std::string tool, nlohmann::json arguments,
                                 nlohmann::json result);
    static HistoryItem reasoning_error(std::string raw_response, std::string error);
    static HistoryItem parsing_error(std::string raw_response, std::string error);
    static HistoryItem emergency_correction(std::string feedback);
    static HistoryItem goal_updated(std::string new_goal);
    static HistoryItem final_answer_proposed(std::string text, std::string feedback);
};

using History = std::vector<HistoryItem>;

std::string kind_of(const HistoryItem& item);

// Persisted / prompt form. Shapes:
//   {"action": {"tool": T, "arguments": A}, "result": R}
//   {"action": "reasoning_error", "raw_response": S, "error": E}
//   {"action": "parsing_error", "raw_response": S, "error": E}
//   {"action": "emergency_correction", "result": {"user_feedback": F}}
//   {"action": "goal_updated", "result": {"new_goal": G}}
//   {"action": {"final_answer_proposed": T}, "result": {"user_feedback": F}}
nlohmann::json to_json(const HistoryItem& item);
nlohmann::json to_json(const History& history);

core::errors::Result<HistoryItem> history_item_from_json(const nlohmann::json& value);
// Items with an unrecognized shape are logged and skipped; only a document that
// is not an array is an error.
core::errors::Result<History> history_from_json(const nlohmann::json& value);

}  // namespace autopilot::protocol
