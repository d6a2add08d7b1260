// ============================================================================
// cogroup/io/executor.hpp - Abstract Executor Interface
// ============================================================================
//
// An Executor decides where coroutines run. TaskGroup schedules every unit
// of work on the executor it was constructed with:
//
//   - ThreadPoolExecutor: units run in parallel on worker threads
//   - LibuvExecutor:      units interleave on one event-loop thread
//
// Each thread may have a "current" executor; awaitables that need to
// reschedule a coroutine (AsyncSleep, CancellationToken::Cancelled) look it
// up through GetCurrentExecutor().
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <functional>

namespace cogroup {

class Executor {
   public:
    virtual ~Executor() = default;

    // Run until Stop() is called.
    virtual void Run() = 0;

    // Process whatever is ready without blocking.
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Resume `handle` on this executor as soon as possible. Thread-safe.
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    // Resume `handle` on this executor once `delay` has elapsed. Thread-safe.
    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    virtual void Post(std::function<void()> callback) = 0;

    // 0 never names a timer.
    using TimerId = std::uint64_t;

    // Runs `callback` once `delay` has elapsed. Unlike ScheduleAfter, it does
    // not wait for a free worker: callbacks must be short and must not block.
    // Thread-safe.
    virtual TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // Drops a pending PostAfter callback, destroying it. A no-op once the
    // callback has started running. Thread-safe.
    virtual void CancelTimer(TimerId id) = 0;
};

[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

// Sets the current executor for the lifetime of the guard.
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace cogroup
