#ifndef AGENTGRAPH_CORE_TYPES_ERRORS_H
#define AGENTGRAPH_CORE_TYPES_ERRORS_H

#include "step.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentgraph {

class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Build-time failure: the graph never becomes usable.
class ConfigurationError : public GraphError {
public:
    using GraphError::GraphError;
};

// Run-time failure; carries the step history accumulated before the failure.
class RunError : public GraphError {
public:
    RunError(ErrorKind kind, const std::string& message,
             std::string run_id = {}, std::vector<Step> history = {})
        : GraphError(message),
          kind_(kind),
          run_id_(std::move(run_id)),
          history_(std::move(history)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& run_id() const noexcept { return run_id_; }
    const std::vector<Step>& history() const noexcept { return history_; }

private:
    ErrorKind kind_;
    std::string run_id_;
    std::vector<Step> history_;
};

class InvalidUpdateError : public RunError {
public:
    explicit InvalidUpdateError(const std::string& message,
                                std::string run_id = {}, std::vector<Step> history = {})
        : RunError(ErrorKind::INVALID_UPDATE, message, std::move(run_id), std::move(history)) {}
};

class NodeInvocationError : public RunError {
public:
    explicit NodeInvocationError(const std::string& message,
                                 std::string run_id = {}, std::vector<Step> history = {})
        : RunError(ErrorKind::NODE_INVOCATION, message, std::move(run_id), std::move(history)) {}
};

class RecursionLimitExceeded : public RunError {
public:
    explicit RecursionLimitExceeded(const std::string& message,
                                    std::string run_id = {}, std::vector<Step> history = {})
        : RunError(ErrorKind::RECURSION_LIMIT, message, std::move(run_id), std::move(history)) {}
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_ERRORS_H
