// ============================================================================
// cogroup/core/task.hpp - Lazy Coroutine Type
// ============================================================================
//
// Task<T> is the coroutine type units of work are written in. It is lazy:
// nothing runs until the Task is co_awaited (or its handle is resumed by an
// executor). On completion control transfers straight back to the awaiting
// coroutine.
//
// A unit of work for a TaskGroup is typically:
//
//   Task<Error> Fetch(CancellationToken token) {
//       while (!token.IsCancelled()) {
//           ...
//       }
//       co_return Error{};
//   }
//
// ============================================================================

#pragma once

#include "cogroup/core/check.hpp"
#include "cogroup/core/coroutine_compat.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <type_traits>
#include <utility>

namespace cogroup {

template <typename T>
class Task;

namespace detail {

// Shared by both promise specializations: resumes whoever awaited the task.
template <typename Promise>
struct TaskFinalAwaiter {
    bool await_ready() noexcept { return false; }

    SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
        auto continuation = finishing.promise().Continuation();
        if (continuation) {
            return SymmetricTransfer(continuation);
        }
        return SymmetricTransfer(std::noop_coroutine());
    }

    void await_resume() noexcept {}
};

class TaskPromiseBase {
   public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    // Exceptions are not part of the unit contract: errors travel as values.
    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        COGROUP_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

    std::coroutine_handle<> Continuation() const noexcept { return continuation_; }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    detail::TaskFinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept { result_ = std::move(value); }

    T& GetResult() & noexcept { return result_.value(); }
    T&& GetResult() && noexcept { return std::move(result_.value()); }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    detail::TaskFinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    void GetResult() noexcept {}
};

// ============================================================================
// Task<T>
// ============================================================================
// Move-only owner of the coroutine frame.
//
template <typename T>
class [[nodiscard("Task must be co_awaited")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Start the task; it transfers back to `awaiting` when done.
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        auto await_resume() noexcept {
            if constexpr (std::is_void_v<T>) {
                handle_.promise().GetResult();
            } else {
                return std::move(handle_.promise()).GetResult();
            }
        }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace cogroup
