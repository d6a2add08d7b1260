// ============================================================================
// cogroup/core/task_group.cpp - TaskGroup Implementation
// ============================================================================

#include "cogroup/core/task_group.hpp"

#include <spdlog/spdlog.h>

namespace cogroup {

namespace detail {

bool GroupState::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_.IsCancelled()) {
        spdlog::debug("task group '{}' is cancelled, not launching", name_);
        return false;
    }
    ++running_;
    return true;
}

void GroupState::Release() {
    std::vector<std::coroutine_handle<>> to_wake;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
        if (running_ == 0) {
            to_wake = std::move(waiters_);
            waiters_.clear();
        }
    }
    for (auto h : to_wake) {
        h.resume();
    }
}

void GroupState::Fail(Error err) {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!first_error_) {
            first_error_ = err;
            first = true;
        }
    }
    if (first) {
        spdlog::debug("task group '{}': unit failed with '{}', cancelling siblings", name_, err.message());
    }
    Cancel(err);
}

bool GroupState::Cancel(Error reason) {
    if (!cancel_.Cancel(reason)) {
        return false;
    }
    spdlog::debug("task group '{}' cancelled: {}", name_, cancel_.Reason().message());
    return true;
}

bool GroupState::Escalate(Error reason, std::atomic<bool>& expired) {
    size_t running = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ == 0) {
            return false;
        }
        running = running_;
        expired.store(true, std::memory_order_release);
    }
    spdlog::info("task group '{}': wait context done ({}), cancelling {} running units", name_, reason.message(),
                 running);
    Cancel(reason);
    return true;
}

size_t GroupState::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

Error GroupState::FirstError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
}

}  // namespace detail

TaskGroup::TaskGroup(Executor& executor) : TaskGroup(executor, Options{}) {}

TaskGroup::TaskGroup(Executor& executor, Options options)
    : executor_(executor),
      options_(std::move(options)),
      state_(std::make_shared<detail::GroupState>(options_.name)) {}

TaskGroup::~TaskGroup() {
    size_t running = state_->Running();
    if (running > 0) {
        spdlog::warn("task group '{}' destroyed with {} running units", state_->Name(), running);
        state_->Cancel(make_error_code(Errc::Cancelled));
    }
}

void TaskGroup::Cancel() {
    state_->Cancel(make_error_code(Errc::Cancelled));
}

Task<Error> TaskGroup::Wait(CancellationToken wait_ctx) {
    auto state = state_;
    auto expired = std::make_shared<std::atomic<bool>>(false);

    {
        // Both paths end in the same join: a fired wait context only
        // cancels the group, it never cuts the wait short.
        CancellationCallbackGuard escalate(wait_ctx, [state, expired, wait_ctx] {
            state->Escalate(wait_ctx.Reason(), *expired);
        });
        co_await state->Settle();
    }

    Error task_error = state->FirstError();
    Error wait_error = expired->load(std::memory_order_acquire) ? wait_ctx.Reason() : Error{};

    if (options_.precedence == ErrorPrecedence::WaitError) {
        co_return wait_error ? wait_error : task_error;
    }
    co_return task_error ? task_error : wait_error;
}

}  // namespace cogroup
