// ============================================================================
// cogroup/core/deadline.cpp - DeadlineSource Timer
// ============================================================================

#include "cogroup/core/deadline.hpp"

#include <memory>
#include <utility>

namespace cogroup {

DeadlineSource::DeadlineSource(Executor& executor, Clock::time_point deadline)
    : deadline_(deadline), executor_(&executor) {
    auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        source_.Cancel(make_error_code(Errc::DeadlineExceeded));
        return;
    }

    // Only a weak reference: once the source and all its tokens are gone
    // there is nobody left to notify.
    std::weak_ptr<CancellationState> state = source_.GetState();
    timer_id_ = executor.PostAfter(std::chrono::ceil<std::chrono::milliseconds>(remaining), [state] {
        if (auto locked = state.lock()) {
            locked->Cancel(make_error_code(Errc::DeadlineExceeded));
        }
    });
}

DeadlineSource::~DeadlineSource() {
    Disarm();
}

DeadlineSource::DeadlineSource(DeadlineSource&& other) noexcept
    : source_(std::move(other.source_)),
      deadline_(other.deadline_),
      executor_(other.executor_),
      timer_id_(std::exchange(other.timer_id_, 0)) {}

DeadlineSource& DeadlineSource::operator=(DeadlineSource&& other) noexcept {
    if (this != &other) {
        Disarm();
        source_ = std::move(other.source_);
        deadline_ = other.deadline_;
        executor_ = other.executor_;
        timer_id_ = std::exchange(other.timer_id_, 0);
    }
    return *this;
}

bool DeadlineSource::Cancel() {
    Disarm();
    return source_.Cancel(make_error_code(Errc::Cancelled));
}

void DeadlineSource::Disarm() {
    if (timer_id_ != 0) {
        executor_->CancelTimer(std::exchange(timer_id_, 0));
    }
}

}  // namespace cogroup
