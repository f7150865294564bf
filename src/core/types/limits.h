#ifndef AGENTGRAPH_CORE_TYPES_LIMITS_H
#define AGENTGRAPH_CORE_TYPES_LIMITS_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace agentgraph {

// Cooperative cancellation flag. Copies share the same flag, so a token handed
// to run options can be cancelled from a worker or from another thread.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// 执行选项
struct RunOptions {
    int max_steps = 25;                          // must be >= 1
    std::chrono::milliseconds node_timeout{0};   // 0 表示无限制
    CancellationToken cancellation;
    std::string run_id;                          // generated when empty
    bool debug = false;                          // step tracing to stdout
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_LIMITS_H
