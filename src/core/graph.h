// core/graph.h
#ifndef AGENTGRAPH_CORE_GRAPH_H
#define AGENTGRAPH_CORE_GRAPH_H

#include "core/types/limits.h"
#include "core/types/node.h"
#include "core/types/snapshot.h"
#include "core/types/step.h"
#include "modules/routing/edge_table.h"
#include "modules/state/state_engine.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace agentgraph {

class GraphBuilder;
class StepStream;

// Compiled, validated graph. Immutable; share it as std::shared_ptr<const Graph>
// and run it from as many threads as needed.
// Only GraphBuilder::compile() creates one, always owned by a shared_ptr.
class Graph : public std::enable_shared_from_this<Graph> {
public:
    class Key {
        Key() = default;
        friend class GraphBuilder;
    };

    Graph(Key,
          StateEngine state_engine,
          std::vector<NodeSpec> nodes,
          RoutingTable routes,
          std::size_t entry);

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // Runs to the end. Throws InvalidUpdateError, NodeInvocationError or
    // RecursionLimitExceeded (with the partial history) on failure.
    // A cancelled run is returned with status CANCELLED.
    RunResult run(const Value& initial = Value::object(), const RunOptions& options = {}) const;

    // Same as run() but reports failures in the result instead of throwing.
    RunResult invoke(const Value& initial = Value::object(), const RunOptions& options = {}) const;

    // Lazy, finite, non-restartable sequence of steps.
    StepStream stream(const Value& initial = Value::object(), const RunOptions& options = {}) const;

    const NodeSpec& node(std::size_t index) const { return nodes_.at(index); }
    std::size_t node_count() const { return nodes_.size(); }

    const NodeSpec& entry_point() const { return nodes_.at(entry_); }
    std::size_t entry_index() const { return entry_; }

    const StateEngine& state_engine() const { return state_engine_; }
    const RoutingTable& routes() const { return routes_; }

    // Node/edge description for diagnostics.
    nlohmann::json describe() const;

private:
    StateEngine state_engine_;
    std::vector<NodeSpec> nodes_;
    RoutingTable routes_;
    std::size_t entry_;
};

// Throws the typed RunError matching result.error, carrying its step history.
[[noreturn]] void throw_run_error(RunResult result);

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_GRAPH_H
