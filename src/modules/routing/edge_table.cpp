// modules/routing/edge_table.cpp
#include "modules/routing/edge_table.h"
#include "core/types/errors.h"
#include <set>
#include <utility>

namespace agentgraph {

namespace {

std::string join_labels(const std::set<std::string>& labels) {
    std::string out;
    for (const auto& label : labels) {
        if (!out.empty()) out += ", ";
        out += "'" + label + "'";
    }
    return out;
}

// Reports labels present on one side only.
void check_same_labels(const NodeId& router,
                       const std::set<std::string>& expected,
                       const std::set<std::string>& actual,
                       const std::string& what) {
    std::set<std::string> missing;
    std::set<std::string> extra;
    for (const auto& label : expected) {
        if (actual.count(label) == 0) missing.insert(label);
    }
    for (const auto& label : actual) {
        if (expected.count(label) == 0) extra.insert(label);
    }
    if (missing.empty() && extra.empty()) {
        return;
    }

    std::string msg = what + " of router '" + router + "' does not match its declared options;";
    if (!missing.empty()) msg += " missing: " + join_labels(missing) + ";";
    if (!extra.empty()) msg += " undeclared: " + join_labels(extra) + ";";
    msg.pop_back();
    throw ConfigurationError(msg);
}

RouteTarget resolve_target(const NodeRegistry& registry, const NodeId& from, const NodeId& to) {
    if (to == END) {
        return Terminal{};
    }
    auto index = registry.index_of(to);
    if (!index) {
        throw ConfigurationError("Edge target not found: '" + to + "' (from '" + from + "')");
    }
    return *index;
}

std::size_t resolve_source(const NodeRegistry& registry, const NodeId& from) {
    if (from == END) {
        throw ConfigurationError("The terminal sentinel cannot have outgoing edges");
    }
    auto index = registry.index_of(from);
    if (!index) {
        throw ConfigurationError("Edge source not found: '" + from + "'");
    }
    return *index;
}

} // namespace

RouteTarget RoutingTable::resolve(std::size_t from, const std::optional<std::string>& label) const {
    const CompiledRoute& r = routes_.at(from);
    if (!r.conditional) {
        return r.target;
    }
    if (!label.has_value()) {
        throw NodeInvocationError("Conditional route requires a label but none was produced");
    }
    auto it = r.dispatch.find(*label);
    if (it == r.dispatch.end()) {
        throw NodeInvocationError("No dispatch entry for label '" + *label + "'");
    }
    return it->second;
}

void EdgeTable::add_edge(NodeId from, NodeId to) {
    static_edges_.push_back({std::move(from), std::move(to)});
}

void EdgeTable::add_conditional_edge(NodeId from,
                                     std::vector<std::string> options,
                                     std::map<std::string, NodeId> dispatch) {
    conditional_edges_.push_back({std::move(from), std::move(options), std::move(dispatch)});
}

RoutingTable EdgeTable::freeze(const NodeRegistry& registry) const {
    std::vector<CompiledRoute> routes(registry.size());
    std::vector<int> outgoing(registry.size(), 0);

    for (const auto& edge : static_edges_) {
        std::size_t from = resolve_source(registry, edge.from);
        const NodeSpec& node = registry.nodes()[from];
        if (node.kind == NodeKind::ROUTER) {
            throw ConfigurationError("Router '" + edge.from +
                                     "' must be routed by a conditional edge, not a static edge to '" +
                                     edge.to + "'");
        }
        routes[from].conditional = false;
        routes[from].target = resolve_target(registry, edge.from, edge.to);
        outgoing[from]++;
    }

    for (const auto& edge : conditional_edges_) {
        std::size_t from = resolve_source(registry, edge.from);
        const NodeSpec& node = registry.nodes()[from];
        if (node.kind != NodeKind::ROUTER) {
            throw ConfigurationError("Conditional edge source '" + edge.from + "' is not a router");
        }

        std::set<std::string> declared(node.options.begin(), node.options.end());
        std::set<std::string> edge_options(edge.options.begin(), edge.options.end());
        if (edge_options.size() != edge.options.size()) {
            throw ConfigurationError("Conditional edge of router '" + edge.from + "' lists an option twice");
        }
        std::set<std::string> keys;
        for (const auto& [label, _] : edge.dispatch) {
            keys.insert(label);
        }
        check_same_labels(edge.from, declared, edge_options, "Option set");
        check_same_labels(edge.from, declared, keys, "Dispatch map");

        CompiledRoute route;
        route.conditional = true;
        for (const auto& [label, target] : edge.dispatch) {
            route.dispatch.emplace(label, resolve_target(registry, edge.from, target));
        }
        routes[from] = std::move(route);
        outgoing[from]++;
    }

    for (std::size_t i = 0; i < registry.size(); ++i) {
        const NodeId& id = registry.nodes()[i].id;
        if (outgoing[i] == 0) {
            throw ConfigurationError("Node '" + id + "' has no outgoing edge");
        }
        if (outgoing[i] > 1) {
            throw ConfigurationError("Node '" + id + "' has more than one outgoing edge");
        }
    }

    return RoutingTable(std::move(routes));
}

} // namespace agentgraph
