// modules/builder/graph_builder.h
#ifndef AGENTGRAPH_MODULES_BUILDER_GRAPH_BUILDER_H
#define AGENTGRAPH_MODULES_BUILDER_GRAPH_BUILDER_H

#include "core/graph.h"
#include "core/types/node.h"
#include "modules/registry/node_registry.h"
#include "modules/routing/edge_table.h"
#include "modules/state/state_engine.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// Assembles nodes and edges into an immutable, validated Graph.
// Node registration fails fast; edge and entry checks run in compile().
class GraphBuilder {
public:
    explicit GraphBuilder(StateSchema schema);

    GraphBuilder& register_node(NodeSpec spec);
    GraphBuilder& register_worker(NodeId id, std::shared_ptr<Worker> worker);
    GraphBuilder& register_router(NodeId id,
                                  std::vector<std::string> options,
                                  std::shared_ptr<Decision> decision,
                                  std::optional<std::string> output_field = std::nullopt);

    GraphBuilder& add_edge(NodeId from, NodeId to);
    GraphBuilder& add_conditional_edge(NodeId from,
                                       std::vector<std::string> options,
                                       std::map<std::string, NodeId> dispatch);

    GraphBuilder& set_entry_point(NodeId id);
    GraphBuilder& set_finish_point(NodeId id); // add_edge(id, END)

    // Throws ConfigurationError; the builder stays usable and can be fixed and recompiled.
    std::shared_ptr<const Graph> compile() const;

    const NodeRegistry& registry() const { return registry_; }

private:
    StateSchema schema_;
    NodeRegistry registry_;
    EdgeTable edges_;
    std::optional<NodeId> entry_;

    void validate_router_fields() const;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_BUILDER_GRAPH_BUILDER_H
