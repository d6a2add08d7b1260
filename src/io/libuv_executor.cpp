// ============================================================================
// cogroup/io/libuv_executor.cpp - LibuvExecutor Implementation
// ============================================================================

#include "cogroup/io/libuv_executor.hpp"

#include <spdlog/spdlog.h>

namespace cogroup {

LibuvExecutor::LibuvExecutor() = default;

Result<std::unique_ptr<LibuvExecutor>, Error> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    int rc = uv_loop_init(&executor->loop_);
    if (rc != 0) {
        spdlog::error("uv_loop_init failed: {}", uv_strerror(rc));
        return Err(make_error_code(Errc::IoError));
    }

    rc = uv_async_init(&executor->loop_, &executor->async_, OnAsync);
    if (rc != 0) {
        spdlog::error("uv_async_init failed: {}", uv_strerror(rc));
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->loop_.data = executor.get();
    executor->async_.data = executor.get();

    rc = uv_idle_init(&executor->loop_, &executor->idle_);
    if (rc != 0) {
        spdlog::error("uv_idle_init failed: {}", uv_strerror(rc));
        uv_close(reinterpret_cast<uv_handle_t*>(&executor->async_), nullptr);
        uv_run(&executor->loop_, UV_RUN_DEFAULT);
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->idle_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    ExecutorGuard guard(this);
    stop_requested_ = false;

    // Finish queued work and wait out sleeping coroutines while the async and
    // idle handles can still take new requests.
    while (HasPendingWork()) {
        if (!idle_active_) {
            uv_idle_start(&idle_, OnIdle);
            idle_active_ = true;
        }
        uv_run(&loop_, UV_RUN_ONCE);
    }

    while (!armed_timers_.empty()) {
        CloseTimer(armed_timers_.begin()->second);
    }
    std::unordered_map<TimerId, std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(dropped, timer_callbacks_);
    }
    if (!dropped.empty()) {
        spdlog::debug("LibuvExecutor: dropped {} pending timers", dropped.size());
    }

    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&idle_), nullptr);

    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    int rc = uv_loop_close(&loop_);
    if (rc != 0) {
        spdlog::warn("uv_loop_close failed: {}", uv_strerror(rc));
    }
}

// PostAfter timers do not count: the destructor drops them.
bool LibuvExecutor::HasPendingWork() {
    if (sleeping_handles_ > 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !ready_queue_.empty() || !callback_queue_.empty() || !timer_queue_.empty();
}

// ============================================================================
// Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    running_ = true;
    ExecutorGuard guard(this);

    uv_run(&loop_, UV_RUN_DEFAULT);

    running_ = false;
    stop_requested_ = false;
}

void LibuvExecutor::RunOnce() {
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_NOWAIT);
}

// uv_stop is not thread-safe; the loop thread calls it from OnAsync.
void LibuvExecutor::Stop() {
    stop_requested_ = true;
    uv_async_send(&async_);
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Scheduling
// ============================================================================

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_queue_.push(handle);
    }
    uv_async_send(&async_);
}

void LibuvExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    if (!handle) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        timer_queue_.push({delay, handle});
    }
    uv_async_send(&async_);
}

void LibuvExecutor::Post(std::function<void()> callback) {
    if (!callback) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        callback_queue_.push(std::move(callback));
    }
    uv_async_send(&async_);
}

LibuvExecutor::TimerId LibuvExecutor::PostAfter(std::chrono::milliseconds delay,
                                                std::function<void()> callback) {
    if (!callback) return 0;
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        id = next_timer_id_++;
        timer_callbacks_.emplace(id, std::move(callback));
        timer_queue_.push({delay, nullptr, id});
    }
    uv_async_send(&async_);
    return id;
}

void LibuvExecutor::CancelTimer(TimerId id) {
    if (id == 0) return;
    std::function<void()> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        auto it = timer_callbacks_.find(id);
        if (it == timer_callbacks_.end()) {
            return;
        }
        dropped = std::move(it->second);
        timer_callbacks_.erase(it);
        cancel_queue_.push(id);
    }
    uv_async_send(&async_);
}

// ============================================================================
// libuv Callbacks
// ============================================================================

void LibuvExecutor::OnAsync(uv_async_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);

    if (self->stop_requested_.load()) {
        uv_stop(&self->loop_);
    }
    if (!self->idle_active_) {
        uv_idle_start(&self->idle_, OnIdle);
        self->idle_active_ = true;
    }
}

void LibuvExecutor::OnIdle(uv_idle_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->ProcessQueues();

    std::lock_guard<std::mutex> lock(self->queue_mutex_);
    if (self->ready_queue_.empty() && self->callback_queue_.empty() && self->timer_queue_.empty() &&
        self->cancel_queue_.empty()) {
        uv_idle_stop(handle);
        self->idle_active_ = false;
    }
}

void LibuvExecutor::OnTimer(uv_timer_t* handle) {
    auto* timer = static_cast<Timer*>(handle->data);
    auto* self = timer->self;
    auto coro = timer->handle;
    TimerId id = timer->id;
    self->CloseTimer(timer);

    if (id == 0) {
        coro.resume();
        return;
    }

    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        auto it = self->timer_callbacks_.find(id);
        if (it == self->timer_callbacks_.end()) {
            return;
        }
        callback = std::move(it->second);
        self->timer_callbacks_.erase(it);
    }
    callback();
}

void LibuvExecutor::OnTimerClosed(uv_handle_t* handle) {
    delete static_cast<Timer*>(handle->data);
}

void LibuvExecutor::CloseTimer(Timer* timer) {
    if (timer->id != 0) {
        armed_timers_.erase(timer->id);
    } else {
        sleeping_handles_--;
    }
    uv_close(reinterpret_cast<uv_handle_t*>(&timer->uv), OnTimerClosed);
}

void LibuvExecutor::StartTimer(const TimerRequest& req) {
    if (req.id != 0) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (timer_callbacks_.count(req.id) == 0) {
            return;  // cancelled before it was armed
        }
    }

    auto* timer = new Timer{{}, this, req.handle, req.id};
    int rc = uv_timer_init(&loop_, &timer->uv);
    if (rc != 0) {
        spdlog::error("uv_timer_init failed: {}, firing immediately", uv_strerror(rc));
        delete timer;
        if (req.id == 0) {
            req.handle.resume();
            return;
        }
        std::function<void()> callback;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            auto it = timer_callbacks_.find(req.id);
            if (it == timer_callbacks_.end()) {
                return;
            }
            callback = std::move(it->second);
            timer_callbacks_.erase(it);
        }
        callback();
        return;
    }
    timer->uv.data = timer;
    if (req.id != 0) {
        armed_timers_.emplace(req.id, timer);
    } else {
        sleeping_handles_++;
    }
    uint64_t delay = req.delay.count() > 0 ? static_cast<uint64_t>(req.delay.count()) : 0;
    uv_timer_start(&timer->uv, OnTimer, delay, 0);
}

// Swap the queues out so coroutines resumed here can schedule more work
// without deadlocking on queue_mutex_.
void LibuvExecutor::ProcessQueues() {
    std::queue<std::coroutine_handle<>> ready;
    std::queue<std::function<void()>> callbacks;
    std::queue<TimerRequest> timers;
    std::queue<TimerId> cancels;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(ready, ready_queue_);
        std::swap(callbacks, callback_queue_);
        std::swap(timers, timer_queue_);
        std::swap(cancels, cancel_queue_);
    }

    while (!ready.empty()) {
        auto handle = ready.front();
        ready.pop();
        handle.resume();
    }

    while (!callbacks.empty()) {
        auto callback = std::move(callbacks.front());
        callbacks.pop();
        callback();
    }

    while (!timers.empty()) {
        StartTimer(timers.front());
        timers.pop();
    }

    while (!cancels.empty()) {
        auto it = armed_timers_.find(cancels.front());
        cancels.pop();
        if (it != armed_timers_.end()) {
            CloseTimer(it->second);
        }
    }
}

}  // namespace cogroup
