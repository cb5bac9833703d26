#include "runtime/reasoning_loop.hpp"

#include <sstream>
#include <thread>
#include <utility>
#include <variant>
#include "context/context_budgeter.hpp"
#include "context/token_estimator.hpp"
#include "core/logging/logger.hpp"
#include "runtime/action_parser.hpp"

namespace autopilot::runtime {

using nlohmann::json;
using protocol::HistoryItem;

namespace {

constexpr const char* kRejectedAnswer = "User rejected the answer.";

std::string compact(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ReasoningLoop::ReasoningLoop(LoopSettings settings, LoopDependencies deps)
    : settings_(std::move(settings)), deps_(deps) {}

std::string ReasoningLoop::tool_hints() const {
    std::ostringstream out;
    out << "Available tools:";
    if (deps_.catalog.empty()) {
        out << " (none announced)";
    }
    std::size_t index = 1;
    for (const auto& name : deps_.catalog.names()) {
        out << "\n" << index++ << ". \"" << name << "\"";
    }
    if (!settings_.extra_tool_hints.empty()) {
        out << "\n\n" << settings_.extra_tool_hints;
    }
    if (deps_.knowledge != nullptr) {
        const std::string learned = deps_.knowledge->describe();
        if (!learned.empty()) {
            out << "\n\n" << learned;
        }
    }
    return out.str();
}

void ReasoningLoop::wait_while_paused(RunState& state) {
    if (!deps_.signals.paused()) {
        return;
    }

    LOG_INFO("Agent is paused. Waiting...");
    state.paused = true;
    while (deps_.signals.paused()) {
        std::this_thread::sleep_for(settings_.pause_poll_interval);
    }
    state.paused = false;
    LOG_INFO("Agent resumed. Re-evaluating goal...");

    const auto goal = deps_.signals.read_goal();
    if (!goal.has_value()) {
        LOG_WARN("Could not re-read goal file after pause. Continuing with old goal.");
        return;
    }
    if (!goal->empty() && goal.value() != state.task) {
        LOG_INFO("Goal has been updated to: '" + goal.value() + "'");
        state.task = goal.value();
        state.history.push_back(HistoryItem::goal_updated(state.task));
    }
}

void ReasoningLoop::apply_budget_decision(RunState& state, const std::size_t kept_count) {
    LOG_INFO("History reset needed - keeping only " + std::to_string(kept_count) +
             " recent items due to token limit");
    const std::size_t drop = state.history.size() - kept_count;
    state.history.erase(state.history.begin(),
                        state.history.begin() + static_cast<std::ptrdiff_t>(drop));
    state.step = kept_count + 1;
    LOG_INFO("History reset: now has " + std::to_string(state.history.size()) + " items");
}

StepOutcome ReasoningLoop::record_action(RunState& state, const std::string& response) {
    const protocol::Action action = parse_action(response);

    if (const auto* failure = std::get_if<protocol::ReasoningFailure>(&action)) {
        LOG_WARN("Could not find a JSON action in the response: " + failure->error);
        state.history.push_back(HistoryItem::reasoning_error(response, failure->error));
        return StepOutcome::Continue;
    }

    if (const auto* failure = std::get_if<protocol::ParsingFailure>(&action)) {
        LOG_ERROR("Error parsing action: " + failure->error);
        state.history.push_back(HistoryItem::parsing_error(response, failure->error));
        return StepOutcome::Continue;
    }

    if (const auto* answer = std::get_if<protocol::FinalAnswerAction>(&action)) {
        LOG_INFO("--- AGENT PROPOSES FINAL ANSWER ---");
        LOG_INFO("Proposed answer: " + answer->text);
        if (answer->text == settings_.final_answer_sentinel) {
            LOG_INFO("--- GOAL ACHIEVED ---");
            return StepOutcome::Finished;
        }
        std::string feedback = deps_.feedback.request_feedback(answer->text);
        if (feedback.empty()) {
            feedback = kRejectedAnswer;
        }
        LOG_INFO("Feedback received. Continuing task...");
        state.history.push_back(HistoryItem::final_answer_proposed(answer->text, feedback));
        return StepOutcome::Continue;
    }

    const auto& call = std::get<protocol::ToolCallAction>(action);
    LOG_INFO("Executing tool '" + call.tool + "' with args: " + compact(call.arguments));
    json result = deps_.tools.call_tool(call.tool, call.arguments);
    LOG_INFO("Tool result: " + compact(result));

    if (deps_.knowledge != nullptr &&
        deps_.knowledge->learn_from(call.tool, call.arguments, result)) {
        const auto saved = deps_.knowledge->save();
        if (core::errors::is_error(saved)) {
            LOG_WARN("Could not save knowledge: " + core::errors::get_error(saved).message);
        }
    }

    state.history.push_back(HistoryItem::tool_call(call.tool, call.arguments, std::move(result)));
    return StepOutcome::Continue;
}

void ReasoningLoop::persist(const RunState& state) {
    const auto saved = deps_.history_store.save(state.history);
    if (core::errors::is_error(saved)) {
        LOG_WARN("Could not save history to " + deps_.history_store.path().string() + ": " +
                 core::errors::get_error(saved).message);
    }
}

void ReasoningLoop::check_correction(RunState& state) {
    const auto correction = deps_.signals.take_correction();
    if (!correction.has_value()) {
        return;
    }
    LOG_INFO("EMERGENCY CORRECTION RECEIVED: '" + correction.value() + "'");
    state.history.push_back(HistoryItem::emergency_correction(correction.value()));
}

StepOutcome ReasoningLoop::step(RunState& state) {
    wait_while_paused(state);
    LOG_INFO("- Step " + std::to_string(state.step) + " -");

    const auto budgeted = context::build_prompt(state.task, tool_hints(), state.history,
                                                settings_.token_ceiling);
    if (budgeted.truncated) {
        apply_budget_decision(state, budgeted.kept_count);
    }

    const std::string response =
        backend::generate_with_retry(deps_.backend, budgeted.prompt, settings_.retry);
    LOG_INFO("Backend response: " + response);
    LOG_INFO("Total context tokens (prompt + response): " +
             std::to_string(budgeted.estimated_tokens + context::estimate_tokens(response)));

    const StepOutcome outcome = record_action(state, response);
    persist(state);
    if (outcome == StepOutcome::Finished) {
        return outcome;
    }

    check_correction(state);
    ++state.step;
    return StepOutcome::Continue;
}

void ReasoningLoop::run(RunState& state) {
    LOG_INFO("--- Starting agent run with task: '" + state.task + "' ---");
    while (step(state) == StepOutcome::Continue) {
    }
}

}  // namespace autopilot::runtime
