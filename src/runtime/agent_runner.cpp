#include "runtime/agent_runner.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include "backend/http_backend.hpp"
#include "core/logging/logger.hpp"
#include "rpc/mcp_client.hpp"
#include "runtime/reasoning_loop.hpp"
#include "session/control_signals.hpp"
#include "session/feedback_source.hpp"
#include "session/history_store.hpp"
#include "session/knowledge_store.hpp"

namespace autopilot::runtime {

namespace {

std::string read_tool_hints(const core::config::AgentConfig& config) {
    if (!config.tool_hints_file.has_value()) {
        return "";
    }
    std::ifstream in(config.tool_hints_file.value());
    if (!in.is_open()) {
        LOG_WARN("Could not read tool hints file: " + config.tool_hints_file->string());
        return "";
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return session::trim(buffer.str());
}

}  // namespace

std::string to_string(const RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::NothingToDo:
            return "nothing_to_do";
        case RunOutcome::GoalAchieved:
            return "goal_achieved";
        default:
            return "unknown";
    }
}

AgentRunner::AgentRunner(core::config::AgentConfig config) : config_(std::move(config)) {}

core::errors::Result<RunOutcome> AgentRunner::run() {
    const auto signals = session::ControlSignals::from_config(config_);

    RunState state;
    const auto goal = signals.read_goal();
    if (!goal.has_value()) {
        LOG_INFO(config_.files.goal + " not found. Agent has nothing to do.");
        return RunOutcome::NothingToDo;
    }
    if (goal->empty()) {
        LOG_INFO("Goal file is empty. Agent has nothing to do.");
        return RunOutcome::NothingToDo;
    }
    state.task = goal.value();

    const session::HistoryStore history_store(config_.path_of(config_.files.history));
    auto loaded = history_store.load();
    if (core::errors::is_error(loaded)) {
        LOG_WARN("Could not load " + history_store.path().string() + " (" +
                 core::errors::get_error(loaded).message + "), starting fresh.");
        const auto moved = history_store.set_aside();
        if (core::errors::is_error(moved)) {
            LOG_WARN(core::errors::get_error(moved).message);
        } else {
            LOG_INFO("Unreadable history kept at " + core::errors::get_value(moved).string());
        }
    } else {
        state.history = std::move(core::errors::get_value(loaded));
        LOG_INFO("Loaded " + std::to_string(state.history.size()) +
                 " previous steps from " + history_store.path().string());
    }
    state.step = state.history.size() + 1;

    session::KnowledgeStore knowledge(config_.path_of(config_.files.knowledge));
    knowledge.load();

    auto connected = rpc::McpClient::connect(config_.server);
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    const std::unique_ptr<rpc::McpClient> client =
        std::move(core::errors::get_value(connected));

    backend::HttpBackend backend(config_.backend);
    session::ConsoleFeedback feedback;

    LOG_INFO("Agent initialized with " + std::to_string(client->tools().size()) + " tool(s).");
    LOG_INFO("Using backend model: " + config_.backend.model);

    LoopSettings settings;
    settings.token_ceiling = config_.token_ceiling;
    settings.final_answer_sentinel = config_.final_answer_sentinel;
    settings.pause_poll_interval = config_.pause_poll_interval;
    settings.retry.attempts = config_.backend.attempts;
    settings.retry.delay = config_.backend.retry_delay;
    settings.extra_tool_hints = read_tool_hints(config_);

    LoopDependencies deps{backend,  *client,  client->tools(), history_store,
                          signals,  feedback, &knowledge};
    ReasoningLoop loop(std::move(settings), deps);
    loop.run(state);

    return RunOutcome::GoalAchieved;
}

}  // namespace autopilot::runtime
