// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "core/types/errors.h"
#include <future>
#include <iostream>
#include <thread>
#include <utility>

namespace agentgraph {

NodeExecutor::NodeExecutor(std::chrono::milliseconds timeout) : timeout_(timeout) {}

Invocation NodeExecutor::execute_node(const NodeSpec& node, const Snapshot& state) const {
    try {
        if (timeout_.count() > 0) {
            return execute_with_timeout(node, state);
        }
        return dispatch(node, state);
    } catch (const NodeInvocationError&) {
        throw;
    } catch (const std::exception& e) {
        throw NodeInvocationError("Node '" + node.id + "' failed: " + e.what());
    } catch (...) {
        throw NodeInvocationError("Node '" + node.id + "' failed with a non-standard exception");
    }
}

Invocation NodeExecutor::execute_with_timeout(const NodeSpec& node, const Snapshot& state) const {
    // 工作线程只持有节点与快照的副本；超时后被放弃的调用可能比本次运行活得更久
    std::packaged_task<Invocation()> task([node, state]() { return dispatch(node, state); });
    std::future<Invocation> result = task.get_future();
    std::thread runner(std::move(task));

    if (result.wait_for(timeout_) == std::future_status::timeout) {
        runner.detach();
        std::cerr << "[WARNING] Node '" << node.id << "' exceeded its timeout of "
                  << timeout_.count() << " ms; invocation abandoned" << std::endl;
        throw NodeInvocationError("Node '" + node.id + "' timed out after " +
                                  std::to_string(timeout_.count()) + " ms");
    }
    runner.join();
    return result.get();
}

Invocation NodeExecutor::dispatch(const NodeSpec& node, const Snapshot& state) {
    switch (node.kind) {
        case NodeKind::WORKER:
            return execute_worker(node, state);
        case NodeKind::ROUTER:
            return execute_router(node, state);
    }
    throw NodeInvocationError("Unknown node kind for node: " + node.id);
}

Invocation NodeExecutor::execute_worker(const NodeSpec& node, const Snapshot& state) {
    Invocation inv;
    inv.update = node.worker->invoke(state);
    return inv;
}

Invocation NodeExecutor::execute_router(const NodeSpec& node, const Snapshot& state) {
    std::string label = node.decision->decide(state);
    if (!node.has_option(label)) {
        std::string declared;
        for (const auto& opt : node.options) {
            if (!declared.empty()) declared += ", ";
            declared += opt;
        }
        throw NodeInvocationError("Router '" + node.id + "' returned undeclared label '" + label +
                                  "' (declared: " + declared + ")");
    }

    Invocation inv;
    if (node.output_field.has_value()) {
        inv.update[*node.output_field] = label;
    }
    inv.route = std::move(label);
    return inv;
}

} // namespace agentgraph
