// modules/scheduler/step_stream.cpp
#include "modules/scheduler/step_stream.h"
#include <utility>

namespace agentgraph {

StepStream::StepStream(std::unique_ptr<RunSession> session) : session_(std::move(session)) {}

std::optional<Step> StepStream::next() {
    return session_->advance();
}

void StepStream::close() {
    session_->cancel();
}

} // namespace agentgraph
