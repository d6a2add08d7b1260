// ============================================================================
// cogroup/io/thread_pool_executor.hpp - Multi-Threaded Executor
// ============================================================================
//
// ThreadPoolExecutor resumes coroutines on a fixed set of worker threads.
// Units launched by a TaskGroup on it run in parallel. Workers start in the
// constructor, so scheduled work runs without anyone calling Run(); Run()
// only blocks until Stop() or until the queue drains.
//
// A dedicated timer thread serves ScheduleAfter() by moving due handles onto
// the work queue. PostAfter() callbacks run on the timer thread itself, so
// they fire even while every worker is blocked (a DeadlineSource relies on
// this to cancel a group whose blocking units hold all the workers).
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "units";
//   ThreadPoolExecutor executor(opts);
//
// ============================================================================

#pragma once

#include "cogroup/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cogroup {

class ThreadPoolExecutor : public Executor {
   public:
    struct Options {
        // Zero is treated as one.
        size_t num_threads = std::thread::hardware_concurrency();

        // Workers are named "<prefix>-<index>"; empty leaves names alone.
        std::string thread_name_prefix = "cogroup-worker";

        Options() = default;
    };

    ThreadPoolExecutor();
    explicit ThreadPoolExecutor(size_t num_threads);
    explicit ThreadPoolExecutor(const Options& options);

    // Stops and joins every thread. Pending PostAfter callbacks are destroyed
    // without running. Coroutine handles still queued or sleeping are neither
    // resumed nor destroyed: their frames stay owned by whoever created them,
    // and a frame nobody owns (a released DetachedTask) leaks.
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void CancelTimer(TimerId id) override;

    size_t NumThreads() const { return workers_.size(); }

    size_t PendingTasks() const;

    // PostAfter callbacks neither fired nor cancelled yet.
    size_t PendingTimers() const;

   private:
    struct WorkItem {
        std::coroutine_handle<> handle{nullptr};
        std::function<void()> callback;

        explicit WorkItem(std::coroutine_handle<> h) : handle(h) {}
        explicit WorkItem(std::function<void()> cb) : callback(std::move(cb)) {}
    };

    // Either a handle to schedule or, when `timer` is non-zero, the id of a
    // callback in timer_callbacks_.
    struct DelayedWork {
        std::chrono::steady_clock::time_point when;
        std::coroutine_handle<> handle;
        TimerId timer = 0;

        bool operator>(const DelayedWork& other) const { return when > other.when; }
    };

    void InitWorkers();
    void WorkerLoop(size_t worker_index);
    void TimerLoop();
    void Execute(WorkItem& item);

    Options options_;

    std::vector<std::thread> workers_;
    std::thread timer_thread_;

    std::queue<WorkItem> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;

    std::priority_queue<DelayedWork, std::vector<DelayedWork>, std::greater<DelayedWork>> delayed_queue_;
    std::unordered_map<TimerId, std::function<void()>> timer_callbacks_;
    TimerId next_timer_id_ = 1;
    mutable std::mutex delayed_mutex_;
    std::condition_variable delayed_cv_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> active_tasks_{0};
};

}  // namespace cogroup
