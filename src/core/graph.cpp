// core/graph.cpp
#include "core/graph.h"
#include "core/types/errors.h"
#include "modules/scheduler/run_session.h"
#include "modules/scheduler/step_stream.h"
#include <utility>

namespace agentgraph {

Graph::Graph(Key,
             StateEngine state_engine,
             std::vector<NodeSpec> nodes,
             RoutingTable routes,
             std::size_t entry)
    : state_engine_(std::move(state_engine)),
      nodes_(std::move(nodes)),
      routes_(std::move(routes)),
      entry_(entry) {}

RunResult Graph::invoke(const Value& initial, const RunOptions& options) const {
    RunSession session(shared_from_this(), initial, options);
    while (session.advance()) {
    }
    return session.result();
}

RunResult Graph::run(const Value& initial, const RunOptions& options) const {
    RunResult result = invoke(initial, options);
    if (result.status == RunStatus::FAILED) {
        throw_run_error(std::move(result));
    }
    return result;
}

void throw_run_error(RunResult result) {
    switch (result.error) {
        case ErrorKind::INVALID_UPDATE:
            throw InvalidUpdateError(result.message, result.run_id, std::move(result.steps));
        case ErrorKind::NODE_INVOCATION:
            throw NodeInvocationError(result.message, result.run_id, std::move(result.steps));
        case ErrorKind::RECURSION_LIMIT:
            throw RecursionLimitExceeded(result.message, result.run_id, std::move(result.steps));
        default:
            throw RunError(result.error, result.message, result.run_id, std::move(result.steps));
    }
}

StepStream Graph::stream(const Value& initial, const RunOptions& options) const {
    return StepStream(std::make_unique<RunSession>(shared_from_this(), initial, options));
}

nlohmann::json Graph::describe() const {
    nlohmann::json out;
    out["entry"] = nodes_.at(entry_).id;

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& field : state_engine_.schema().fields()) {
        fields[field.name] = {{"reducer", to_string(field.reducer)}, {"default", field.default_value}};
    }
    out["state"] = std::move(fields);

    auto target_name = [this](const RouteTarget& target) -> std::string {
        return is_terminal(target) ? END : nodes_.at(std::get<std::size_t>(target)).id;
    };

    nlohmann::json nodes = nlohmann::json::array();
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const NodeSpec& spec = nodes_[i];
        const CompiledRoute& route = routes_.route(i);
        nlohmann::json node;
        node["id"] = spec.id;
        node["kind"] = to_string(spec.kind);
        if (spec.kind == NodeKind::ROUTER) {
            node["options"] = spec.options;
        }
        if (route.conditional) {
            nlohmann::json dispatch = nlohmann::json::object();
            for (const auto& label : spec.options) {
                dispatch[label] = target_name(route.dispatch.at(label));
            }
            node["dispatch"] = std::move(dispatch);
        } else {
            node["next"] = target_name(route.target);
        }
        if (!spec.metadata.empty()) {
            node["metadata"] = spec.metadata;
        }
        nodes.push_back(std::move(node));
    }
    out["nodes"] = std::move(nodes);
    return out;
}

} // namespace agentgraph
