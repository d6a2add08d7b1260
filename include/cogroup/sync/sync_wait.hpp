// ============================================================================
// cogroup/sync/sync_wait.hpp - Blocking Bridge for Synchronous Callers
// ============================================================================
//
// SyncWait(task) starts `task` on the calling thread and blocks the thread
// until it completes, wherever the completion happens (typically a worker
// of a ThreadPoolExecutor). It is how main() and tests wait on a group:
//
//   ThreadPoolExecutor executor(4);
//   TaskGroup group(executor);
//   group.Go(...);
//   Error err = SyncWait(group.Wait());
//
// Never call it from a coroutine running on a single-threaded executor: the
// thread it blocks is the one that would have to finish the task.
//
// ============================================================================

#pragma once

#include "cogroup/core/detached_task.hpp"
#include "cogroup/core/task.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace cogroup {

namespace detail {

class SyncWaitEvent {
   public:
    void Signal() {
        std::lock_guard lock(mutex_);
        signaled_ = true;
        cv_.notify_one();
    }

    void Wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return signaled_; });
    }

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

}  // namespace detail

// The runner frame is destroyed before the waiting thread is woken, so
// nothing is left running on another thread when SyncWait returns.
template <typename T>
T SyncWait(Task<T> task) {
    detail::SyncWaitEvent event;
    std::optional<T> result;

    auto runner = [](Task<T> inner, std::optional<T>& out) -> Task<void> {
        out.emplace(co_await std::move(inner));
    };

    auto detached = MakeDetached(runner(std::move(task), result));
    detached.SetCallback([&event] { event.Signal(); });
    detached.Start();
    event.Wait();

    return std::move(*result);
}

inline void SyncWait(Task<void> task) {
    detail::SyncWaitEvent event;

    auto detached = MakeDetached(std::move(task));
    detached.SetCallback([&event] { event.Signal(); });
    detached.Start();
    event.Wait();
}

}  // namespace cogroup
