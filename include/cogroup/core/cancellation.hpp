// ============================================================================
// cogroup/core/cancellation.hpp - Cooperative Cancellation
// ============================================================================
//
// A CancellationSource owns a one-shot, broadcast "please stop" signal.
// CancellationTokens are read-only views of it: every token obtained from
// the same source observes the same triggering event. Cancellation is
// cooperative; nothing is interrupted, units poll the token or wait on it.
//
// Triggering is idempotent. The first Cancel() records a reason (an Error,
// Errc::Cancelled by default) and runs every registered callback exactly
// once; later calls change nothing.
//
// USAGE:
// ------
//   CancellationSource source;
//   auto token = source.GetToken();
//
//   // poll
//   while (!token.IsCancelled()) { ... }
//
//   // or block (inside a coroutine)
//   Error why = co_await token.Cancelled();
//
//   source.Cancel(make_error_code(Errc::DeadlineExceeded));
//
// ============================================================================

#pragma once

#include "cogroup/core/error.hpp"
#include "cogroup/io/executor.hpp"

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace cogroup {

class CancellationSource;

// ============================================================================
// CancellationState - Shared state between a source and its tokens
// ============================================================================
class CancellationState {
   public:
    CancellationState() = default;

    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    Error Reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    // Returns true only for the call that actually triggered the signal.
    bool Cancel(Error reason = make_error_code(Errc::Cancelled)) {
        std::vector<Callback> to_call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return false;
            }
            reason_ = reason ? reason : make_error_code(Errc::Cancelled);
            cancelled_.store(true, std::memory_order_release);
            to_call = std::move(callbacks_);
            callbacks_.clear();
        }

        // Outside the lock: a callback may register or unregister others.
        for (auto& entry : to_call) {
            entry.fn();
        }
        return true;
    }

    // Runs `callback` immediately (outside the lock) when already cancelled
    // and returns 0 in that case.
    size_t RegisterCallback(std::function<void()> callback) {
        size_t handle = RegisterIfActive(callback);
        if (handle == 0) {
            callback();
        }
        return handle;
    }

    // Like RegisterCallback, but never runs `callback` inline. Returns 0 and
    // drops the callback when the state is already cancelled.
    size_t RegisterIfActive(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return 0;
        }
        size_t handle = next_handle_++;
        callbacks_.push_back({handle, std::move(callback)});
        return handle;
    }

    void UnregisterCallback(size_t handle) {
        if (handle == 0) return;

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->handle == handle) {
                callbacks_.erase(it);
                break;
            }
        }
    }

   private:
    struct Callback {
        size_t handle;
        std::function<void()> fn;
    };

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    Error reason_;
    std::vector<Callback> callbacks_;
    size_t next_handle_{1};
};

// ============================================================================
// CancelledAwaitable - co_await token.Cancelled()
// ============================================================================
// Suspends until the token is cancelled and yields the cancellation reason.
// The coroutine is resumed on the executor it suspended on, if any, so it
// does not run on the canceller's stack. A token that can never be
// cancelled (None) never resumes.
//
class CancelledAwaitable {
   public:
    explicit CancelledAwaitable(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    bool await_ready() const noexcept { return state_ && state_->IsCancelled(); }

    bool await_suspend(std::coroutine_handle<> h) {
        if (!state_) {
            return true;
        }
        Executor* executor = GetCurrentExecutor();
        size_t handle = state_->RegisterIfActive([h, executor] {
            if (executor) {
                executor->Schedule(h);
            } else {
                h.resume();
            }
        });
        return handle != 0;
    }

    Error await_resume() const { return state_ ? state_->Reason() : Error{}; }

   private:
    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationToken - Read-only view of the signal
// ============================================================================
class CancellationToken {
   public:
    // A token that is never cancelled.
    CancellationToken() = default;

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    // Empty until cancelled.
    Error Reason() const { return state_ ? state_->Reason() : Error{}; }

    // True while not cancelled, so `while (token) { ... }` reads naturally.
    explicit operator bool() const noexcept { return !IsCancelled(); }

    size_t OnCancel(std::function<void()> callback) {
        if (state_) {
            return state_->RegisterCallback(std::move(callback));
        }
        return 0;
    }

    void Unregister(size_t handle) {
        if (state_) {
            state_->UnregisterCallback(handle);
        }
    }

    [[nodiscard]] CancelledAwaitable Cancelled() const { return CancelledAwaitable(state_); }

    bool IsValid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] static CancellationToken None() { return CancellationToken{}; }

   private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationSource - Owns and triggers the signal
// ============================================================================
class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) = default;
    CancellationSource& operator=(CancellationSource&&) = default;

    [[nodiscard]] CancellationToken GetToken() const { return CancellationToken(state_); }

    bool Cancel(Error reason = make_error_code(Errc::Cancelled)) { return state_ && state_->Cancel(reason); }

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    Error Reason() const { return state_ ? state_->Reason() : Error{}; }

    // For timers that must not keep the state alive.
    [[nodiscard]] std::weak_ptr<CancellationState> GetState() const { return state_; }

   private:
    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationCallbackGuard - Scoped registration
// ============================================================================
class CancellationCallbackGuard {
   public:
    CancellationCallbackGuard(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), handle_(token_.OnCancel(std::move(callback))) {}

    ~CancellationCallbackGuard() { token_.Unregister(handle_); }

    CancellationCallbackGuard(const CancellationCallbackGuard&) = delete;
    CancellationCallbackGuard& operator=(const CancellationCallbackGuard&) = delete;

   private:
    CancellationToken token_;
    size_t handle_;
};

}  // namespace cogroup
