#ifndef AGENTGRAPH_CORE_TYPES_TRACE_H
#define AGENTGRAPH_CORE_TYPES_TRACE_H

#include "node.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentgraph {

// One record per step attempt, including attempts that failed.
struct TraceRecord {
    std::string run_id;
    std::size_t step_index = 0;
    NodeId node_id;
    std::string kind; // "worker" or "router"
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "success", "failed"
    std::optional<std::string> error_message;
    nlohmann::json state_delta = nlohmann::json::object(); // fields changed by the step
    std::optional<std::string> route;                       // label chosen by a router
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_TRACE_H
