// modules/trace/trace_exporter.h
#ifndef AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/node.h"
#include "core/types/trace.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgraph {

// Unique per process: "t-<epoch millis>-<sequence>".
std::string generate_run_id();

class TraceExporter {
public:
    explicit TraceExporter(std::string run_id);

    void on_step_start(std::size_t step_index, const NodeSpec& node);

    void on_step_end(
        std::size_t step_index,
        const std::string& status,
        const std::optional<std::string>& error_message,
        const nlohmann::json& state_delta,
        const std::optional<std::string>& route
    );

    const std::vector<TraceRecord>& get_traces() const { return traces_; }
    const std::string& run_id() const { return run_id_; }

    static nlohmann::json to_json(const TraceRecord& record);
    static nlohmann::json to_json(const std::vector<TraceRecord>& records);

private:
    std::string run_id_;
    std::vector<TraceRecord> traces_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
