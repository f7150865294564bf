// modules/scheduler/run_session.h
#ifndef AGENTGRAPH_MODULES_SCHEDULER_RUN_SESSION_H
#define AGENTGRAPH_MODULES_SCHEDULER_RUN_SESSION_H

#include "core/graph.h"
#include "core/types/limits.h"
#include "core/types/snapshot.h"
#include "core/types/step.h"
#include "modules/executor/node_executor.h"
#include "modules/guard/termination_guard.h"
#include "modules/trace/trace_exporter.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// RunSession 封装了单次执行的所有状态和逻辑
// (current snapshot, step counter, history, traces). One thread at a time.
class RunSession {
public:
    // Throws ConfigurationError for invalid options. An invalid initial state
    // yields a session that is already FAILED(INVALID_UPDATE).
    RunSession(std::shared_ptr<const Graph> graph, const Value& initial, RunOptions options);

    // Executes one step. Returns the completed step, or std::nullopt once the
    // run has ended (completed, failed or cancelled).
    std::optional<Step> advance();

    // Stops the run at the current step boundary.
    void cancel();

    bool finished() const { return status_ != RunStatus::RUNNING; }
    RunStatus status() const { return status_; }
    const std::vector<Step>& steps() const { return steps_; }
    const Snapshot& state() const { return state_; }

    RunResult result() const;

private:
    std::shared_ptr<const Graph> graph_;
    RunOptions options_;
    TerminationGuard guard_;
    NodeExecutor node_executor_;
    TraceExporter trace_exporter_;

    Snapshot state_;
    std::optional<std::size_t> current_; // node that runs next
    std::vector<Step> steps_;

    RunStatus status_ = RunStatus::RUNNING;
    ErrorKind error_ = ErrorKind::NONE;
    std::string message_;
    std::optional<NodeId> stopped_at_;

    void fail(ErrorKind kind, std::string message);
    void finish(RunStatus status, std::string message);
    void log_step(const Step& step) const;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEDULER_RUN_SESSION_H
