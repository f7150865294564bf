#ifndef AGENTGRAPH_CORE_TYPES_NODE_H
#define AGENTGRAPH_CORE_TYPES_NODE_H

#include "snapshot.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgraph {

// 节点ID类型
using NodeId = std::string; // e.g., "supervisor"

// Terminal sentinel: the "no further node" target. Never a registered node.
inline const NodeId END = "__end__";

// 节点类型枚举
enum class NodeKind : uint8_t {
    WORKER,
    ROUTER
};

inline const char* to_string(NodeKind kind) {
    return kind == NodeKind::ROUTER ? "router" : "worker";
}

// Worker capability: free-form logic returning a partial state update
// (a JSON object of declared fields, or null for "no change").
// With RunOptions::node_timeout set, a timed-out invoke() keeps running on a
// detached thread and may overlap later calls on the same instance, so such
// workers must be safe to re-enter.
class Worker {
public:
    virtual ~Worker() = default;
    [[nodiscard]] virtual Value invoke(const Snapshot& state) = 0;
};

// Decision capability backing a Router: returns one label of the router's option set.
// Same re-entry requirement as Worker when used with node_timeout.
class Decision {
public:
    virtual ~Decision() = default;
    [[nodiscard]] virtual std::string decide(const Snapshot& state) = 0;
};

using WorkerFunction = std::function<Value(const Snapshot&)>;
using DecisionFunction = std::function<std::string(const Snapshot&)>;

class FunctionWorker : public Worker {
public:
    explicit FunctionWorker(WorkerFunction fn) : fn_(std::move(fn)) {}
    [[nodiscard]] Value invoke(const Snapshot& state) override { return fn_(state); }

private:
    WorkerFunction fn_;
};

class FunctionDecision : public Decision {
public:
    explicit FunctionDecision(DecisionFunction fn) : fn_(std::move(fn)) {}
    [[nodiscard]] std::string decide(const Snapshot& state) override { return fn_(state); }

private:
    DecisionFunction fn_;
};

inline std::shared_ptr<Worker> make_worker(WorkerFunction fn) {
    return std::make_shared<FunctionWorker>(std::move(fn));
}

inline std::shared_ptr<Decision> make_decision(DecisionFunction fn) {
    return std::make_shared<FunctionDecision>(std::move(fn));
}

// Registered node: identifier plus its capability.
struct NodeSpec {
    NodeId id;
    NodeKind kind = NodeKind::WORKER;
    std::shared_ptr<Worker> worker;          // WORKER only
    std::shared_ptr<Decision> decision;      // ROUTER only
    std::vector<std::string> options;        // ROUTER: declared labels, declaration order
    std::optional<std::string> output_field; // ROUTER: field receiving the chosen label
    nlohmann::json metadata = nlohmann::json::object(); // opaque, reported by Graph::describe()

    bool has_option(const std::string& label) const {
        for (const auto& opt : options) {
            if (opt == label) return true;
        }
        return false;
    }
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_NODE_H
