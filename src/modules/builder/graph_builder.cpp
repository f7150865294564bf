// modules/builder/graph_builder.cpp
#include "modules/builder/graph_builder.h"
#include "core/types/errors.h"
#include <utility>

namespace agentgraph {

GraphBuilder::GraphBuilder(StateSchema schema) : schema_(std::move(schema)) {}

GraphBuilder& GraphBuilder::register_node(NodeSpec spec) {
    registry_.register_node(std::move(spec));
    return *this;
}

GraphBuilder& GraphBuilder::register_worker(NodeId id, std::shared_ptr<Worker> worker) {
    registry_.register_worker(std::move(id), std::move(worker));
    return *this;
}

GraphBuilder& GraphBuilder::register_router(NodeId id,
                                            std::vector<std::string> options,
                                            std::shared_ptr<Decision> decision,
                                            std::optional<std::string> output_field) {
    registry_.register_router(std::move(id), std::move(options), std::move(decision), std::move(output_field));
    return *this;
}

GraphBuilder& GraphBuilder::add_edge(NodeId from, NodeId to) {
    edges_.add_edge(std::move(from), std::move(to));
    return *this;
}

GraphBuilder& GraphBuilder::add_conditional_edge(NodeId from,
                                                 std::vector<std::string> options,
                                                 std::map<std::string, NodeId> dispatch) {
    edges_.add_conditional_edge(std::move(from), std::move(options), std::move(dispatch));
    return *this;
}

GraphBuilder& GraphBuilder::set_entry_point(NodeId id) {
    entry_ = std::move(id);
    return *this;
}

GraphBuilder& GraphBuilder::set_finish_point(NodeId id) {
    return add_edge(std::move(id), END);
}

void GraphBuilder::validate_router_fields() const {
    for (const auto& node : registry_.nodes()) {
        if (node.kind != NodeKind::ROUTER || !node.output_field) {
            continue;
        }
        const FieldSpec* field = schema_.find(*node.output_field);
        if (!field) {
            throw ConfigurationError("Router '" + node.id + "' writes undeclared state field '" +
                                     *node.output_field + "'");
        }
        if (field->reducer != Reducer::OVERWRITE) {
            throw ConfigurationError("Router '" + node.id + "' output field '" + *node.output_field +
                                     "' must use the overwrite reducer");
        }
    }
}

std::shared_ptr<const Graph> GraphBuilder::compile() const {
    if (!entry_.has_value()) {
        throw ConfigurationError("No entry point set");
    }
    if (*entry_ == END) {
        throw ConfigurationError("The terminal sentinel cannot be the entry point");
    }
    auto entry = registry_.index_of(*entry_);
    if (!entry) {
        throw ConfigurationError("Entry point not found: '" + *entry_ + "'");
    }

    validate_router_fields();
    RoutingTable routes = edges_.freeze(registry_);

    std::shared_ptr<Graph> graph = std::make_shared<Graph>(Graph::Key{}, StateEngine(schema_), registry_.nodes(),
                                                           std::move(routes), *entry);
    return graph;
}

} // namespace agentgraph
