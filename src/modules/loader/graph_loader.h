// modules/loader/graph_loader.h
#ifndef AGENTGRAPH_MODULES_LOADER_GRAPH_LOADER_H
#define AGENTGRAPH_MODULES_LOADER_GRAPH_LOADER_H

#include "core/graph.h"
#include "core/types/limits.h"
#include "core/types/node.h"
#include "modules/builder/graph_builder.h"
#include "modules/capabilities/capability_registry.h"
#include "modules/state/state_engine.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgraph {

struct LoadedGraph {
    std::shared_ptr<const Graph> graph;
    RunOptions options; // from the document's `run:` section
};

// Builds a compiled graph from a YAML graph document. Node capabilities are
// bound by name from the CapabilityRegistry or built from the built-in kinds
// (template/tool workers, expression/llm routers).
// Every structural problem is reported as ConfigurationError.
class GraphLoader {
public:
    explicit GraphLoader(CapabilityRegistry capabilities = {});

    LoadedGraph load_from_string(const std::string& yaml_content);
    LoadedGraph load_from_file(const std::string& file_path);
    LoadedGraph load_from_json(const nlohmann::json& doc);

    NodeSpec create_node_from_json(const nlohmann::json& node_json, const StateSchema& schema);

private:
    CapabilityRegistry capabilities_;
    std::shared_ptr<TextGenerator> default_generator_; // lazily loaded from llm_config.json

    static StateSchema parse_schema(const nlohmann::json& state_json);
    static RunOptions parse_run_options(const nlohmann::json& run_json);
    static void add_edges(GraphBuilder& builder, const nlohmann::json& edges_json);

    std::shared_ptr<Worker> create_worker(const NodeId& id, const nlohmann::json& spec, const StateSchema& schema);
    std::shared_ptr<Decision> create_decision(const NodeId& id, const nlohmann::json& spec,
                                              const std::vector<std::string>& options);
    std::shared_ptr<TextGenerator> resolve_generator(const nlohmann::json& spec);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_LOADER_GRAPH_LOADER_H
