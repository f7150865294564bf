// modules/registry/node_registry.h
#ifndef AGENTGRAPH_MODULES_REGISTRY_NODE_REGISTRY_H
#define AGENTGRAPH_MODULES_REGISTRY_NODE_REGISTRY_H

#include "core/types/node.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgraph {

// Maps node ids to capabilities. Registration order is the node index order
// used by the compiled graph.
class NodeRegistry {
public:
    // Throws ConfigurationError on empty/reserved/duplicate id or a missing capability.
    void register_node(NodeSpec spec);

    void register_worker(NodeId id, std::shared_ptr<Worker> worker,
                         nlohmann::json metadata = nlohmann::json::object());

    void register_router(NodeId id,
                         std::vector<std::string> options,
                         std::shared_ptr<Decision> decision,
                         std::optional<std::string> output_field = std::nullopt);

    const NodeSpec* find(const NodeId& id) const;
    std::optional<std::size_t> index_of(const NodeId& id) const;

    const std::vector<NodeSpec>& nodes() const { return nodes_; }
    std::size_t size() const { return nodes_.size(); }

private:
    std::vector<NodeSpec> nodes_;
    std::unordered_map<NodeId, std::size_t> index_;

    static void validate_spec(const NodeSpec& spec);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_REGISTRY_NODE_REGISTRY_H
