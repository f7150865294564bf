// modules/scheduler/step_stream.h
#ifndef AGENTGRAPH_MODULES_SCHEDULER_STEP_STREAM_H
#define AGENTGRAPH_MODULES_SCHEDULER_STEP_STREAM_H

#include "core/types/step.h"
#include "modules/scheduler/run_session.h"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

namespace agentgraph {

// Pull-based producer of step events for one run. Finite and non-restartable:
// every pull advances the same run. close() is cancellation, not an error.
class StepStream {
public:
    explicit StepStream(std::unique_ptr<RunSession> session);

    StepStream(StepStream&&) noexcept = default;
    StepStream& operator=(StepStream&&) noexcept = default;
    StepStream(const StepStream&) = delete;
    StepStream& operator=(const StepStream&) = delete;

    std::optional<Step> next();
    void close();
    bool done() const { return session_->finished(); }

    RunResult result() const { return session_->result(); }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Step;
        using difference_type = std::ptrdiff_t;
        using pointer = const Step*;
        using reference = const Step&;

        iterator() = default;
        explicit iterator(StepStream* stream) : stream_(stream) { ++*this; }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = stream_->next();
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) { return !it.current_.has_value(); }

    private:
        StepStream* stream_ = nullptr;
        std::optional<Step> current_;
    };

    // Resumes from the current position; a second begin() does not restart the run.
    iterator begin() { return iterator(this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

private:
    std::unique_ptr<RunSession> session_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_SCHEDULER_STEP_STREAM_H
