// ============================================================================
// cogroup/core/detached_task.hpp - Self-Destroying Coroutine
// ============================================================================
//
// DetachedTask owns nothing once started: its frame destroys itself when the
// body finishes and then invokes the completion callback. Destroying the
// frame first matters to TaskGroup: by the time the callback reports a unit
// as returned, the unit's callable and everything it captured are gone.
//
// A DetachedTask is started either inline with Start(), or handed to an
// executor with Release():
//
//   auto detached = MakeDetached(Work());
//   detached.SetCallback([] { ... });
//   executor.Schedule(detached.Release());
//
// ============================================================================

#pragma once

#include "cogroup/core/check.hpp"
#include "cogroup/core/task.hpp"

#include <coroutine>
#include <cstdlib>
#include <functional>
#include <utility>

namespace cogroup {

class DetachedTask {
   public:
    struct promise_type {
        std::function<void()> callback;

        DetachedTask get_return_object() noexcept {
            return DetachedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct FinalAwaiter {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                    auto callback = std::move(h.promise().callback);
                    h.destroy();
                    if (callback) {
                        callback();
                    }
                }
                void await_resume() noexcept {}
            };
            return FinalAwaiter{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit DetachedTask(Handle h) noexcept : handle_(h) {}

    DetachedTask(DetachedTask&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    DetachedTask& operator=(DetachedTask&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    DetachedTask(const DetachedTask&) = delete;
    DetachedTask& operator=(const DetachedTask&) = delete;

    // A frame that was never started or released is still ours to destroy.
    ~DetachedTask() {
        if (handle_) {
            handle_.destroy();
        }
    }

    void SetCallback(std::function<void()> cb) {
        if (handle_) {
            handle_.promise().callback = std::move(cb);
        }
    }

    // Run inline until the first suspension point.
    void Start() {
        if (handle_) {
            std::exchange(handle_, nullptr).resume();
        }
    }

    // Give up ownership; whoever resumes the handle starts the coroutine.
    [[nodiscard]] Handle Release() noexcept {
        COGROUP_CHECK(handle_, "DetachedTask released twice");
        return std::exchange(handle_, nullptr);
    }

   private:
    Handle handle_;
};

inline DetachedTask MakeDetached(Task<void> task) {
    co_await std::move(task);
}

}  // namespace cogroup
