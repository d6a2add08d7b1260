// ============================================================================
// cogroup/sync/event.hpp - Manual-Reset Async Event
// ============================================================================
//
// Coroutines co_await event.Wait(); Set() resumes all of them inline on the
// calling thread and lets later waiters pass straight through until Reset().
//
// ============================================================================

#pragma once

#include <coroutine>
#include <mutex>
#include <vector>

namespace cogroup {

class AsyncEvent {
   public:
    AsyncEvent() = default;

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;
    AsyncEvent(AsyncEvent&&) = delete;
    AsyncEvent& operator=(AsyncEvent&&) = delete;

    class WaitAwaitable {
       public:
        explicit WaitAwaitable(AsyncEvent& event) : event_(event) {}

        bool await_ready() noexcept {
            std::lock_guard<std::mutex> lock(event_.mutex_);
            return event_.signaled_;
        }

        bool await_suspend(std::coroutine_handle<> h) noexcept {
            std::lock_guard<std::mutex> lock(event_.mutex_);
            if (event_.signaled_) {
                return false;
            }
            event_.waiters_.push_back(h);
            return true;
        }

        void await_resume() noexcept {}

       private:
        AsyncEvent& event_;
    };

    WaitAwaitable Wait() { return WaitAwaitable(*this); }

    void Set() {
        std::vector<std::coroutine_handle<>> to_wake;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (signaled_) {
                return;
            }
            signaled_ = true;
            to_wake = std::move(waiters_);
            waiters_.clear();
        }
        for (auto h : to_wake) {
            h.resume();
        }
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        signaled_ = false;
    }

    bool IsSet() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return signaled_;
    }

   private:
    mutable std::mutex mutex_;
    bool signaled_ = false;
    std::vector<std::coroutine_handle<>> waiters_;
};

}  // namespace cogroup
