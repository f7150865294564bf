// modules/scheduler/run_session.cpp
#include "modules/scheduler/run_session.h"
#include "core/types/errors.h"
#include <iostream>
#include <utility>

namespace agentgraph {

namespace {

RunOptions with_run_id(RunOptions options) {
    if (options.run_id.empty()) {
        options.run_id = generate_run_id();
    }
    return options;
}

} // namespace

RunSession::RunSession(std::shared_ptr<const Graph> graph, const Value& initial, RunOptions options)
    : graph_(std::move(graph)),
      options_(with_run_id(std::move(options))),
      guard_(options_),
      node_executor_(guard_.node_timeout()),
      trace_exporter_(options_.run_id),
      current_(graph_->entry_index()) {
    try {
        state_ = graph_->state_engine().initialize(initial);
    } catch (const InvalidUpdateError& e) {
        fail(ErrorKind::INVALID_UPDATE, std::string("Invalid initial state: ") + e.what());
    }
}

std::optional<Step> RunSession::advance() {
    if (finished()) {
        return std::nullopt;
    }

    // 步边界：先检查取消，再检查步数预算
    if (guard_.cancellation_requested()) {
        finish(RunStatus::CANCELLED, "Run cancelled after " + std::to_string(steps_.size()) + " steps");
        return std::nullopt;
    }
    const NodeSpec& node = graph_->node(*current_);
    if (!guard_.try_consume_step()) {
        fail(ErrorKind::RECURSION_LIMIT,
             "Recursion limit of " + std::to_string(guard_.max_steps()) + " steps reached without hitting " +
             END + " (next node: '" + node.id + "')");
        return std::nullopt;
    }

    const std::size_t index = steps_.size() + 1;
    trace_exporter_.on_step_start(index, node);

    Invocation invocation;
    Snapshot next_state;
    RouteTarget target;
    try {
        invocation = node_executor_.execute_node(node, state_);
        next_state = graph_->state_engine().apply(state_, invocation.update);
        target = graph_->routes().resolve(*current_, invocation.route);
    } catch (const RunError& e) {
        std::string message = e.what();
        if (e.kind() == ErrorKind::INVALID_UPDATE) {
            message = "Node '" + node.id + "' produced an invalid update: " + message;
        }
        trace_exporter_.on_step_end(index, "failed", message, Value::object(), invocation.route);
        fail(e.kind(), std::move(message));
        return std::nullopt;
    }

    Step step;
    step.index = index;
    step.node = node.id;
    step.kind = node.kind;
    step.update = invocation.update.is_null() ? Value::object() : invocation.update;
    step.state = next_state;
    step.route = invocation.route;

    trace_exporter_.on_step_end(index, "success", std::nullopt,
                                StateEngine::diff(state_, next_state), invocation.route);
    state_ = std::move(next_state);
    steps_.push_back(step);
    log_step(step);

    if (is_terminal(target)) {
        current_.reset();
        finish(RunStatus::COMPLETED, "Reached " + END + " after " + std::to_string(steps_.size()) + " steps");
    } else {
        current_ = std::get<std::size_t>(target);
    }
    return step;
}

void RunSession::cancel() {
    if (finished()) {
        return;
    }
    finish(RunStatus::CANCELLED, "Run cancelled by caller after " + std::to_string(steps_.size()) + " steps");
}

void RunSession::fail(ErrorKind kind, std::string message) {
    error_ = kind;
    finish(RunStatus::FAILED, std::move(message));
}

void RunSession::finish(RunStatus status, std::string message) {
    status_ = status;
    message_ = std::move(message);
    if (current_.has_value()) {
        stopped_at_ = graph_->node(*current_).id;
    }
    if (options_.debug) {
        std::cout << "[DEBUG] run " << options_.run_id << " " << to_string(status_)
                  << ": " << message_ << std::endl;
    }
}

void RunSession::log_step(const Step& step) const {
    if (!options_.debug) {
        return;
    }
    std::cout << "[DEBUG] run " << options_.run_id << " step " << step.index
              << " node=" << step.node << " (" << to_string(step.kind) << ")";
    if (step.route) {
        std::cout << " route=" << *step.route;
    }
    std::cout << " update=" << step.update.dump() << std::endl;
}

RunResult RunSession::result() const {
    RunResult r;
    r.success = status_ == RunStatus::COMPLETED;
    r.status = status_;
    r.error = error_;
    r.message = status_ == RunStatus::RUNNING ? "Run in progress" : message_;
    r.run_id = options_.run_id;
    r.final_state = state_;
    r.steps = steps_;
    r.traces = trace_exporter_.get_traces();
    r.stopped_at = stopped_at_;
    return r;
}

} // namespace agentgraph
