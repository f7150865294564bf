// modules/executor/node_executor.h
#ifndef AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "core/types/node.h"
#include "core/types/snapshot.h"
#include <chrono>
#include <optional>
#include <string>

namespace agentgraph {

// Output of one node invocation.
struct Invocation {
    Value update = Value::object();
    std::optional<std::string> route; // label chosen by a router
};

class NodeExecutor {
public:
    explicit NodeExecutor(std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    // 执行一个节点，返回其部分更新
    // Every capability failure, timeout or undeclared router label is
    // reported as NodeInvocationError.
    Invocation execute_node(const NodeSpec& node, const Snapshot& state) const;

private:
    std::chrono::milliseconds timeout_;

    Invocation execute_with_timeout(const NodeSpec& node, const Snapshot& state) const;

    // 内部执行方法，根据节点类型分发
    static Invocation dispatch(const NodeSpec& node, const Snapshot& state);
    static Invocation execute_worker(const NodeSpec& node, const Snapshot& state);
    static Invocation execute_router(const NodeSpec& node, const Snapshot& state);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_EXECUTOR_NODE_EXECUTOR_H
