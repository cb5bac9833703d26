#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "backend/backend_client.hpp"
#include "protocol/history_record.hpp"
#include "rpc/tool_catalog.hpp"
#include "rpc/tool_dispatcher.hpp"
#include "session/control_signals.hpp"
#include "session/feedback_source.hpp"
#include "session/history_store.hpp"
#include "session/knowledge_store.hpp"

namespace autopilot::runtime {

// The single run this process drives.
struct RunState {
    std::string task;
    protocol::History history;
    std::size_t step = 1;
    bool paused = false;
};

enum class StepOutcome {
    Continue,
    Finished
};

struct LoopSettings {
    std::size_t token_ceiling = 5000;
    std::string final_answer_sentinel = "Your detailed answer here.";
    std::chrono::milliseconds pause_poll_interval{1000};
    backend::RetryPolicy retry;
    std::string extra_tool_hints;
};

// Collaborators the loop talks to. Non-owning; all must outlive the loop.
// `knowledge` may be null.
struct LoopDependencies {
    backend::Backend& backend;
    rpc::ToolDispatcher& tools;
    const rpc::ToolCatalog& catalog;
    const session::HistoryStore& history_store;
    const session::ControlSignals& signals;
    session::FeedbackSource& feedback;
    session::KnowledgeStore* knowledge = nullptr;
};

class ReasoningLoop {
public:
    ReasoningLoop(LoopSettings settings, LoopDependencies deps);

    // One cycle: pause gate, budgeted prompt, backend call, action, dispatch,
    // persist, correction check, step advance. Finished only for the accepted
    // final answer.
    StepOutcome step(RunState& state);

    // Repeats step() until the run finishes.
    void run(RunState& state);

    std::string tool_hints() const;

private:
    void wait_while_paused(RunState& state);
    void apply_budget_decision(RunState& state, std::size_t kept_count);
    StepOutcome record_action(RunState& state, const std::string& response);
    void persist(const RunState& state);
    void check_correction(RunState& state);

    LoopSettings settings_;
    LoopDependencies deps_;
};

}  // namespace autopilot::runtime
