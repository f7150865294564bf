// modules/registry/node_registry.cpp
#include "modules/registry/node_registry.h"
#include "core/types/errors.h"
#include <unordered_set>
#include <utility>

namespace agentgraph {

void NodeRegistry::validate_spec(const NodeSpec& spec) {
    if (spec.id.empty()) {
        throw ConfigurationError("Node id must not be empty");
    }
    if (spec.id == END) {
        throw ConfigurationError("Node id '" + END + "' is reserved for the terminal sentinel");
    }

    if (spec.kind == NodeKind::WORKER) {
        if (!spec.worker) {
            throw ConfigurationError("Worker node '" + spec.id + "' has no capability");
        }
        return;
    }

    if (!spec.decision) {
        throw ConfigurationError("Router node '" + spec.id + "' has no decision capability");
    }
    if (spec.options.empty()) {
        throw ConfigurationError("Router node '" + spec.id + "' declares no options");
    }
    std::unordered_set<std::string> seen;
    for (const auto& label : spec.options) {
        if (label.empty()) {
            throw ConfigurationError("Router node '" + spec.id + "' declares an empty option");
        }
        if (!seen.insert(label).second) {
            throw ConfigurationError("Router node '" + spec.id + "' declares option '" + label + "' twice");
        }
    }
    if (spec.output_field.has_value() && spec.output_field->empty()) {
        throw ConfigurationError("Router node '" + spec.id + "' has an empty output_field");
    }
}

void NodeRegistry::register_node(NodeSpec spec) {
    validate_spec(spec);
    if (index_.count(spec.id) > 0) {
        throw ConfigurationError("Duplicate node id: " + spec.id);
    }
    index_[spec.id] = nodes_.size();
    nodes_.push_back(std::move(spec));
}

void NodeRegistry::register_worker(NodeId id, std::shared_ptr<Worker> worker, nlohmann::json metadata) {
    NodeSpec spec;
    spec.id = std::move(id);
    spec.kind = NodeKind::WORKER;
    spec.worker = std::move(worker);
    spec.metadata = std::move(metadata);
    register_node(std::move(spec));
}

void NodeRegistry::register_router(NodeId id,
                                   std::vector<std::string> options,
                                   std::shared_ptr<Decision> decision,
                                   std::optional<std::string> output_field) {
    NodeSpec spec;
    spec.id = std::move(id);
    spec.kind = NodeKind::ROUTER;
    spec.decision = std::move(decision);
    spec.options = std::move(options);
    spec.output_field = std::move(output_field);
    register_node(std::move(spec));
}

const NodeSpec* NodeRegistry::find(const NodeId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<std::size_t> NodeRegistry::index_of(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace agentgraph
