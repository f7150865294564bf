#ifndef AGENTGRAPH_CORE_TYPES_STEP_H
#define AGENTGRAPH_CORE_TYPES_STEP_H

#include "node.h"
#include "snapshot.h"
#include "trace.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// One completed step: node invocation plus the merged snapshot it produced.
struct Step {
    std::size_t index = 0; // 1-based, totally ordered within a run
    NodeId node;
    NodeKind kind = NodeKind::WORKER;
    Value update = Value::object();
    Snapshot state;
    std::optional<std::string> route; // routers only
};

enum class RunStatus : uint8_t {
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class ErrorKind : uint8_t {
    NONE,
    CONFIGURATION,
    INVALID_UPDATE,
    NODE_INVOCATION,
    RECURSION_LIMIT
};

inline const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::INVALID_UPDATE: return "invalid_update";
        case ErrorKind::NODE_INVOCATION: return "node_invocation";
        case ErrorKind::RECURSION_LIMIT: return "recursion_limit";
    }
    return "unknown";
}

// 执行结果
struct RunResult {
    bool success = false;
    RunStatus status = RunStatus::RUNNING;
    ErrorKind error = ErrorKind::NONE;
    std::string message;            // 错误信息或成功信息
    std::string run_id;
    Snapshot final_state;           // 执行结束时的状态
    std::vector<Step> steps;
    std::vector<TraceRecord> traces;
    std::optional<NodeId> stopped_at; // node that failed, or would have run next
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_STEP_H
