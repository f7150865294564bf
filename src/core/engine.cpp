// src/core/engine.cpp
#include "agentgraph/core/engine.h"
#include <iostream>
#include <utility>

namespace agentgraph {

std::unique_ptr<GraphEngine> GraphEngine::from_yaml(const std::string& yaml_content,
                                                    CapabilityRegistry capabilities) {
    GraphLoader loader(std::move(capabilities));
    return std::make_unique<GraphEngine>(loader.load_from_string(yaml_content));
}

std::unique_ptr<GraphEngine> GraphEngine::from_file(const std::string& file_path,
                                                    CapabilityRegistry capabilities) {
    GraphLoader loader(std::move(capabilities));
    return std::make_unique<GraphEngine>(loader.load_from_file(file_path));
}

GraphEngine::GraphEngine(LoadedGraph loaded)
    : graph_(std::move(loaded.graph)), options_(std::move(loaded.options)) {
    if (!graph_) {
        throw ConfigurationError("GraphEngine requires a compiled graph");
    }
    if (options_.debug) {
        std::cout << "[DEBUG] graph loaded: " << graph_->node_count() << " nodes, entry '"
                  << graph_->entry_point().id << "'" << std::endl;
    }
}

RunOptions GraphEngine::make_options() const {
    RunOptions options = options_;
    options.cancellation = CancellationToken{};
    options.run_id.clear();
    return options;
}

RunResult GraphEngine::invoke(const Value& initial) {
    RunResult result = graph_->invoke(initial, make_options());
    last_traces_ = result.traces;
    return result;
}

RunResult GraphEngine::run(const Value& initial) {
    RunResult result = invoke(initial);
    if (result.status == RunStatus::FAILED) {
        throw_run_error(std::move(result));
    }
    return result;
}

StepStream GraphEngine::stream(const Value& initial) const {
    return graph_->stream(initial, make_options());
}

} // namespace agentgraph
