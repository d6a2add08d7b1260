// ============================================================================
// cogroup/io/libuv_executor.hpp - libuv Event-Loop Executor
// ============================================================================
//
// LibuvExecutor runs every coroutine on the thread that calls Run(). Units
// of a TaskGroup on it interleave cooperatively: a unit runs until it
// suspends (on a cancellation token, a timer, an event) and the loop picks
// the next ready one.
//
// Schedule(), ScheduleAfter(), Post(), PostAfter(), CancelTimer() and Stop()
// may be called from any thread; they queue the request and wake the loop
// through a uv_async_t. libuv timers are created and closed on the loop
// thread only, so a cancelled PostAfter timer is stopped on the next loop
// iteration.
//
// ============================================================================

#pragma once

#include "cogroup/core/error.hpp"
#include "cogroup/core/result.hpp"
#include "cogroup/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <uv.h>

namespace cogroup {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, Error> Create();

    // Resumes whatever is still queued and keeps the loop going until every
    // pending ScheduleAfter timer has fired, so no sleeping coroutine is left
    // behind. Pending PostAfter callbacks are dropped without running.
    ~LibuvExecutor() override;

    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void CancelTimer(TimerId id) override;

    uv_loop_t* GetLoop() { return &loop_; }

   private:
    LibuvExecutor();

    // A handle to resume, or (id != 0) a callback in timer_callbacks_.
    struct TimerRequest {
        std::chrono::milliseconds delay;
        std::coroutine_handle<> handle;
        TimerId id = 0;
    };

    // Owns the uv_timer_t; freed in OnTimerClosed.
    struct Timer {
        uv_timer_t uv;
        LibuvExecutor* self;
        std::coroutine_handle<> handle;
        TimerId id;
    };

    static void OnAsync(uv_async_t* handle);
    static void OnTimer(uv_timer_t* handle);
    static void OnIdle(uv_idle_t* handle);
    static void OnTimerClosed(uv_handle_t* handle);

    void ProcessQueues();
    void StartTimer(const TimerRequest& req);
    void CloseTimer(Timer* timer);
    bool HasPendingWork();

    uv_loop_t loop_;
    uv_async_t async_;
    uv_idle_t idle_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool idle_active_ = false;
    size_t sleeping_handles_ = 0;

    // PostAfter timers started on the loop. Loop thread only.
    std::unordered_map<TimerId, Timer*> armed_timers_;

    std::mutex queue_mutex_;
    std::queue<std::coroutine_handle<>> ready_queue_;
    std::queue<std::function<void()>> callback_queue_;
    std::queue<TimerRequest> timer_queue_;
    std::queue<TimerId> cancel_queue_;
    std::unordered_map<TimerId, std::function<void()>> timer_callbacks_;
    TimerId next_timer_id_ = 1;
};

}  // namespace cogroup
