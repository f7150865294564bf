// modules/guard/termination_guard.cpp
#include "modules/guard/termination_guard.h"
#include "core/types/errors.h"
#include <string>

namespace agentgraph {

TerminationGuard::TerminationGuard(const RunOptions& options)
    : max_steps_(options.max_steps),
      node_timeout_(options.node_timeout),
      token_(options.cancellation) {
    if (max_steps_ < 1) {
        throw ConfigurationError("max_steps must be at least 1, got " + std::to_string(max_steps_));
    }
    if (node_timeout_.count() < 0) {
        throw ConfigurationError("node_timeout must not be negative");
    }
}

bool TerminationGuard::try_consume_step() {
    if (steps_used_ >= max_steps_) return false; // Would exceed
    ++steps_used_;
    return true;
}

} // namespace agentgraph
