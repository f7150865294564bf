// modules/routing/edge_table.h
#ifndef AGENTGRAPH_MODULES_ROUTING_EDGE_TABLE_H
#define AGENTGRAPH_MODULES_ROUTING_EDGE_TABLE_H

#include "core/types/node.h"
#include "modules/registry/node_registry.h"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace agentgraph {

// Terminal sentinel as a routing target.
struct Terminal {
    friend bool operator==(const Terminal&, const Terminal&) = default;
};

// Resolved target: the terminal sentinel or a dense node index of the compiled graph.
using RouteTarget = std::variant<Terminal, std::size_t>;

inline bool is_terminal(const RouteTarget& target) {
    return std::holds_alternative<Terminal>(target);
}

struct StaticEdge {
    NodeId from;
    NodeId to; // node id or END
};

struct ConditionalEdge {
    NodeId from;                              // must be a router
    std::vector<std::string> options;         // must equal the router's declared options
    std::map<std::string, NodeId> dispatch;   // label -> node id or END
};

// Outgoing edge of one node after compile().
struct CompiledRoute {
    bool conditional = false;
    RouteTarget target = Terminal{};
    std::unordered_map<std::string, RouteTarget> dispatch;
};

class RoutingTable {
public:
    RoutingTable() = default;
    explicit RoutingTable(std::vector<CompiledRoute> routes) : routes_(std::move(routes)) {}

    // Label is required (and must be dispatched) for conditional routes.
    RouteTarget resolve(std::size_t from, const std::optional<std::string>& label) const;

    const CompiledRoute& route(std::size_t from) const { return routes_.at(from); }
    std::size_t size() const { return routes_.size(); }

private:
    std::vector<CompiledRoute> routes_;
};

// Build-time edge declarations, keyed by node id. freeze() validates them
// against the registry and resolves ids to indices.
class EdgeTable {
public:
    void add_edge(NodeId from, NodeId to);
    void add_conditional_edge(NodeId from,
                              std::vector<std::string> options,
                              std::map<std::string, NodeId> dispatch);

    // Throws ConfigurationError on dangling references, a node with zero or
    // several outgoing edges, or a dispatch map that does not cover the
    // router's option set exactly.
    RoutingTable freeze(const NodeRegistry& registry) const;

private:
    std::vector<StaticEdge> static_edges_;
    std::vector<ConditionalEdge> conditional_edges_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_ROUTING_EDGE_TABLE_H
