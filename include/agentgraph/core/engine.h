// agentgraph/core/engine.h
#ifndef AGENTGRAPH_CORE_ENGINE_H
#define AGENTGRAPH_CORE_ENGINE_H

#include "core/graph.h"
#include "core/types/errors.h"
#include "modules/builder/graph_builder.h"
#include "modules/capabilities/capability_registry.h"
#include "modules/capabilities/routers.h"
#include "modules/capabilities/workers.h"
#include "modules/loader/graph_loader.h"
#include "modules/scheduler/step_stream.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

// Runs a graph loaded from a YAML document with the document's `run:` options.
class GraphEngine {
public:
    static std::unique_ptr<GraphEngine> from_yaml(const std::string& yaml_content,
                                                  CapabilityRegistry capabilities = {});
    static std::unique_ptr<GraphEngine> from_file(const std::string& file_path,
                                                  CapabilityRegistry capabilities = {});

    explicit GraphEngine(LoadedGraph loaded);

    // Throws the typed RunError on failure (see Graph::run).
    RunResult run(const Value& initial = Value::object());
    RunResult invoke(const Value& initial = Value::object());
    StepStream stream(const Value& initial = Value::object()) const;

    // Each run gets its own cancellation token; use this to stop it from another thread.
    RunOptions make_options() const;

    std::vector<TraceRecord> get_last_traces() const { return last_traces_; }

    std::shared_ptr<const Graph> graph() const { return graph_; }
    const RunOptions& default_options() const { return options_; }

private:
    std::shared_ptr<const Graph> graph_;
    RunOptions options_;
    std::vector<TraceRecord> last_traces_; // ← 存储 Trace
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_ENGINE_H
