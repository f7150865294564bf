// modules/guard/termination_guard.h
#ifndef AGENTGRAPH_MODULES_GUARD_TERMINATION_GUARD_H
#define AGENTGRAPH_MODULES_GUARD_TERMINATION_GUARD_H

#include "core/types/limits.h"
#include <chrono>

namespace agentgraph {

// TerminationGuard 封装了单次执行的步数预算和取消逻辑
class TerminationGuard {
public:
    // Throws ConfigurationError when max_steps < 1 or node_timeout is negative.
    explicit TerminationGuard(const RunOptions& options);

    // 尝试消耗一个步数预算
    // 返回 false 表示再执行一步将超过 max_steps
    bool try_consume_step();

    bool cancellation_requested() const { return token_.is_cancelled(); }

    int max_steps() const { return max_steps_; }
    std::chrono::milliseconds node_timeout() const { return node_timeout_; }

private:
    int max_steps_;
    int steps_used_ = 0;
    std::chrono::milliseconds node_timeout_;
    CancellationToken token_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GUARD_TERMINATION_GUARD_H
