// ============================================================================
// cogroup/io/thread_pool_executor.cpp - ThreadPoolExecutor Implementation
// ============================================================================

#include "cogroup/io/thread_pool_executor.hpp"

#include <pthread.h>
#include <spdlog/spdlog.h>

namespace cogroup {

namespace {

// Linux limits thread names to 15 characters plus the terminator.
void SetCurrentThreadName(const std::string& name) {
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

}  // namespace

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    options_.num_threads = num_threads;
    InitWorkers();
}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options) : options_(options) {
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    running_ = true;

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
    timer_thread_ = std::thread([this] { TimerLoop(); });

    spdlog::debug("thread pool '{}' started with {} workers", options_.thread_name_prefix, options_.num_threads);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    // Coroutine frames still queued belong to their owners (DetachedTask,
    // Task); they are not destroyed here.
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!work_queue_.empty()) {
            spdlog::warn("thread pool '{}' destroyed with {} queued items", options_.thread_name_prefix,
                         work_queue_.size());
        }
    }

    // Pending PostAfter callbacks are ours; destroy them outside the lock.
    std::unordered_map<TimerId, std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        dropped.swap(timer_callbacks_);
    }
    if (!dropped.empty()) {
        spdlog::debug("thread pool '{}' dropped {} pending timers", options_.thread_name_prefix, dropped.size());
    }
}

// ============================================================================
// Executor Interface
// ============================================================================

// Workers are already running; this only blocks the caller.
void ThreadPoolExecutor::Run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    work_available_.wait(lock, [this] { return stopping_ || (work_queue_.empty() && active_tasks_ == 0); });
}

void ThreadPoolExecutor::RunOnce() {
    WorkItem item{std::coroutine_handle<>{nullptr}};
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (work_queue_.empty()) {
            return;
        }
        item = std::move(work_queue_.front());
        work_queue_.pop();
        active_tasks_++;
    }
    Execute(item);
}

void ThreadPoolExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        running_ = false;
    }
    work_available_.notify_all();
    {
        // Pairs with the predicate checks in TimerLoop.
        std::lock_guard<std::mutex> lock(delayed_mutex_);
    }
    delayed_cv_.notify_all();
}

bool ThreadPoolExecutor::IsRunning() const {
    return running_;
}

void ThreadPoolExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work_queue_.emplace(handle);
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    if (!handle) return;

    auto when = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        delayed_queue_.push({when, handle});
    }
    delayed_cv_.notify_one();
}

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work_queue_.emplace(std::move(callback));
    }
    work_available_.notify_one();
}

Executor::TimerId ThreadPoolExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (!callback) return 0;

    auto when = std::chrono::steady_clock::now() + delay;
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        id = next_timer_id_++;
        timer_callbacks_.emplace(id, std::move(callback));
        delayed_queue_.push({when, nullptr, id});
    }
    delayed_cv_.notify_one();
    return id;
}

void ThreadPoolExecutor::CancelTimer(TimerId id) {
    if (id == 0) return;

    // Destroyed outside the lock: its captures may run arbitrary destructors.
    std::function<void()> dropped;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        auto it = timer_callbacks_.find(id);
        if (it == timer_callbacks_.end()) {
            return;
        }
        dropped = std::move(it->second);
        timer_callbacks_.erase(it);
    }
    // The queue entry stays behind and is skipped when it comes due.
}

size_t ThreadPoolExecutor::PendingTimers() const {
    std::lock_guard<std::mutex> lock(delayed_mutex_);
    return timer_callbacks_.size();
}

size_t ThreadPoolExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return work_queue_.size();
}

// ============================================================================
// Workers
// ============================================================================

void ThreadPoolExecutor::Execute(WorkItem& item) {
    if (item.handle) {
        item.handle.resume();
    } else if (item.callback) {
        item.callback();
    }
    {
        // Decrement under the lock so Run() cannot miss the last completion.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_tasks_--;
    }
    work_available_.notify_all();
}

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    SetCurrentExecutor(this);
    if (!options_.thread_name_prefix.empty()) {
        SetCurrentThreadName(options_.thread_name_prefix + "-" + std::to_string(worker_index));
    }

    while (true) {
        WorkItem item{std::coroutine_handle<>{nullptr}};
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !work_queue_.empty(); });
            if (stopping_) {
                break;
            }
            item = std::move(work_queue_.front());
            work_queue_.pop();
            active_tasks_++;
        }
        Execute(item);
    }

    SetCurrentExecutor(nullptr);
}

void ThreadPoolExecutor::TimerLoop() {
    std::unique_lock<std::mutex> lock(delayed_mutex_);
    while (!stopping_) {
        if (delayed_queue_.empty()) {
            delayed_cv_.wait(lock, [this] { return stopping_ || !delayed_queue_.empty(); });
            continue;
        }

        auto when = delayed_queue_.top().when;
        if (std::chrono::steady_clock::now() < when) {
            delayed_cv_.wait_until(lock, when);
            continue;
        }

        DelayedWork due = delayed_queue_.top();
        delayed_queue_.pop();

        std::function<void()> callback;
        if (due.timer != 0) {
            auto it = timer_callbacks_.find(due.timer);
            if (it == timer_callbacks_.end()) {
                continue;  // cancelled
            }
            callback = std::move(it->second);
            timer_callbacks_.erase(it);
        }

        lock.unlock();
        if (callback) {
            callback();
            callback = nullptr;
        } else {
            Schedule(due.handle);
        }
        lock.lock();
    }
}

}  // namespace cogroup
