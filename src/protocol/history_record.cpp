#include "protocol/history_record.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace autopilot::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

AgentError bad_item(const std::string& reason) {
    return AgentError{ErrorCategory::Persistence, "Unrecognized history item: " + reason,
                      "invalid_history_item"};
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

HistoryItem HistoryItem::tool_call(std::string tool, json arguments, json result) {
    return HistoryItem{ToolCallRecord{std::move(tool), std::move(arguments)}, std::move(result)};
}

HistoryItem HistoryItem::reasoning_error(std::string raw_response, std::string error) {
    return HistoryItem{ReasoningErrorRecord{std::move(raw_response), std::move(error)},
                       json::object()};
}

HistoryItem HistoryItem::parsing_error(std::string raw_response, std::string error) {
    return HistoryItem{ParsingErrorRecord{std::move(raw_response), std::move(error)},
                       json::object()};
}

HistoryItem HistoryItem::emergency_correction(std::string feedback) {
    json result = {{"user_feedback", feedback}};
    return HistoryItem{EmergencyCorrectionRecord{std::move(feedback)}, std::move(result)};
}

HistoryItem HistoryItem::goal_updated(std::string new_goal) {
    json result = {{"new_goal", new_goal}};
    return HistoryItem{GoalUpdatedRecord{std::move(new_goal)}, std::move(result)};
}

HistoryItem HistoryItem::final_answer_proposed(std::string text, std::string feedback) {
    json result = {{"user_feedback", std::move(feedback)}};
    return HistoryItem{FinalAnswerProposedRecord{std::move(text)}, std::move(result)};
}

std::string kind_of(const HistoryItem& item) {
    return std::visit(overloaded{
                          [](const ToolCallRecord&) { return std::string("tool_call"); },
                          [](const ReasoningErrorRecord&) { return std::string("reasoning_error"); },
                          [](const ParsingErrorRecord&) { return std::string("parsing_error"); },
                          [](const EmergencyCorrectionRecord&) {
                              return std::string("emergency_correction");
                          },
                          [](const GoalUpdatedRecord&) { return std::string("goal_updated"); },
                          [](const FinalAnswerProposedRecord&) {
                              return std::string("final_answer_proposed");
                          },
                      },
                      item.action);
}

json to_json(const HistoryItem& item) {
    return std::visit(
        overloaded{
            [&item](const ToolCallRecord& call) {
                return json{{"action", {{"tool", call.tool}, {"arguments", call.arguments}}},
                            {"result", item.result}};
            },
            [](const ReasoningErrorRecord& failure) {
                return json{{"action", "reasoning_error"},
                            {"raw_response", failure.raw_response},
                            {"error", failure.error}};
            },
            [](const ParsingErrorRecord& failure) {
                return json{{"action", "parsing_error"},
                            {"raw_response", failure.raw_response},
                            {"error", failure.error}};
            },
            [&item](const EmergencyCorrectionRecord&) {
                return json{{"action", "emergency_correction"}, {"result", item.result}};
            },
            [&item](const GoalUpdatedRecord&) {
                return json{{"action", "goal_updated"}, {"result", item.result}};
            },
            [&item](const FinalAnswerProposedRecord& proposal) {
                return json{{"action", {{"final_answer_proposed", proposal.text}}},
                            {"result", item.result}};
            },
        },
        item.action);
}

json to_json(const History& history) {
    json array = json::array();
    for (const auto& item : history) {
        array.push_back(to_json(item));
    }
    return array;
}

core::errors::Result<HistoryItem> history_item_from_json(const json& value) {
    if (!value.is_object()) {
        return bad_item("not an object");
    }
    const auto action_it = value.find("action");
    if (action_it == value.end()) {
        return bad_item("missing action");
    }
    json result = value.contains("result") ? value.at("result") : json::object();

    if (action_it->is_object()) {
        const auto& action = *action_it;
        if (action.contains("tool") && action.at("tool").is_string()) {
            json arguments = action.contains("arguments") ? action.at("arguments")
                                                          : json::object();
            return HistoryItem::tool_call(action.at("tool").get<std::string>(),
                                          std::move(arguments), std::move(result));
        }
        if (action.contains("final_answer_proposed")) {
            const auto& text = action.at("final_answer_proposed");
            HistoryItem item{FinalAnswerProposedRecord{text.is_string() ? text.get<std::string>()
                                                                        : text.dump()},
                             std::move(result)};
            return item;
        }
        return bad_item("unknown action object");
    }

    if (!action_it->is_string()) {
        return bad_item("action is neither string nor object");
    }
    const std::string kind = action_it->get<std::string>();
    if (kind == "reasoning_error") {
        return HistoryItem::reasoning_error(string_field(value, "raw_response"),
                                            string_field(value, "error"));
    }
    if (kind == "parsing_error") {
        return HistoryItem::parsing_error(string_field(value, "raw_response"),
                                          string_field(value, "error"));
    }
    if (kind == "emergency_correction") {
        HistoryItem item{EmergencyCorrectionRecord{string_field(result, "user_feedback")},
                         std::move(result)};
        return item;
    }
    if (kind == "goal_updated") {
        HistoryItem item{GoalUpdatedRecord{string_field(result, "new_goal")}, std::move(result)};
        return item;
    }
    return bad_item("unknown action kind '" + kind + "'");
}

core::errors::Result<History> history_from_json(const json& value) {
    if (!value.is_array()) {
        return AgentError{ErrorCategory::Persistence, "History document is not a JSON array.",
                          "invalid_history_document"};
    }
    History history;
    history.reserve(value.size());
    for (std::size_t index = 0; index < value.size(); ++index) {
        auto item = history_item_from_json(value[index]);
        if (core::errors::is_error(item)) {
            LOG_WARN("Skipping history item " + std::to_string(index) + ": " +
                     core::errors::get_error(item).message);
            continue;
        }
        history.push_back(std::move(core::errors::get_value(item)));
    }
    return history;
}

}  // namespace autopilot::protocol
