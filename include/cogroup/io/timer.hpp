// ============================================================================
// cogroup/io/timer.hpp - AsyncSleep
// ============================================================================
//
// co_await AsyncSleep(50ms) suspends the coroutine and asks an executor to
// resume it after the delay. The executor is the one passed explicitly, or
// the current thread's executor. With neither, the sleep completes
// immediately: there is nothing that could resume the coroutine later.
//
// ============================================================================

#pragma once

#include "cogroup/io/executor.hpp"

#include <algorithm>
#include <chrono>
#include <coroutine>

namespace cogroup {

class AsyncSleep {
   public:
    template <typename Rep, typename Period>
    explicit AsyncSleep(std::chrono::duration<Rep, Period> duration, Executor* executor = nullptr)
        : duration_(std::max(std::chrono::ceil<std::chrono::milliseconds>(duration), std::chrono::milliseconds::zero())),
          executor_(executor) {}

    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = executor_ ? executor_ : GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->ScheduleAfter(duration_, handle);
        return true;
    }

    void await_resume() const noexcept {}

   private:
    std::chrono::milliseconds duration_;
    Executor* executor_;
};

}  // namespace cogroup
