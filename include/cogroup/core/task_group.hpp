// ============================================================================
// cogroup/core/task_group.hpp - Structured Concurrency with Cancellation
// ============================================================================
//
// TaskGroup launches a dynamic set of units of work on an executor, shares
// one cancellation signal between all of them, and joins them.
//
//   - Go(fns...) starts each unit unless the group is already cancelled;
//     a cancelled group never starts anything again.
//   - The first unit to return a non-empty Error cancels every sibling, and
//     that error is the one Wait() reports.
//   - Cancel() asks every unit to stop without making Wait() fail.
//   - Wait(ctx) joins. If `ctx` is cancelled first (a deadline, a caller
//     giving up), the group is cancelled and Wait() keeps waiting until
//     every unit has returned; only then does it report ctx's reason.
//
// A unit is any callable taking a CancellationToken and returning either
// Task<Error> (a coroutine) or Error (a plain function, which occupies an
// executor thread until it returns).
//
// USAGE:
// ------
//   ThreadPoolExecutor executor(4);
//   TaskGroup group(executor);
//
//   group.Go(
//       [](CancellationToken token) -> Task<Error> {
//           co_await token.Cancelled();
//           co_return Error{};
//       },
//       [](CancellationToken) -> Task<Error> {
//           co_return make_error_code(Errc::IoError);  // cancels the first
//       });
//
//   Error err = SyncWait(group.WaitFor(5s));  // Errc::IoError
//
// ============================================================================

#pragma once

#include "cogroup/core/cancellation.hpp"
#include "cogroup/core/deadline.hpp"
#include "cogroup/core/detached_task.hpp"
#include "cogroup/core/error.hpp"
#include "cogroup/core/task.hpp"
#include "cogroup/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <concepts>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cogroup {

// Which error Wait() reports when a unit failed and the wait context also
// fired before the group settled.
enum class ErrorPrecedence {
    TaskError,
    WaitError,
};

template <typename F>
concept UnitFunction =
    std::invocable<std::decay_t<F>&, CancellationToken> &&
    (std::same_as<std::invoke_result_t<std::decay_t<F>&, CancellationToken>, Task<Error>> ||
     std::convertible_to<std::invoke_result_t<std::decay_t<F>&, CancellationToken>, Error>);

namespace detail {

// Everything units and waiters share. Units hold it through shared_ptr, so
// it outlives a TaskGroup that is destroyed early.
class GroupState {
   public:
    explicit GroupState(std::string name) : name_(std::move(name)) {}

    GroupState(const GroupState&) = delete;
    GroupState& operator=(const GroupState&) = delete;

    // Counts a new unit in, unless the group is cancelled. The check and the
    // increment happen in one critical section.
    bool TryAcquire();

    // A unit returned: wakes every waiter once the last one is out.
    void Release();

    // Records `err` if it is the first error and cancels the group.
    void Fail(Error err);

    bool Cancel(Error reason);

    // Cancels on behalf of a waiter whose context fired, and sets `expired`,
    // unless the group has already settled.
    bool Escalate(Error reason, std::atomic<bool>& expired);

    size_t Running() const;
    Error FirstError() const;

    [[nodiscard]] CancellationToken Token() const { return cancel_.GetToken(); }
    bool IsCancelled() const noexcept { return cancel_.IsCancelled(); }
    const std::string& Name() const noexcept { return name_; }

    class SettleAwaitable {
       public:
        explicit SettleAwaitable(GroupState& state) : state_(state) {}

        bool await_ready() {
            std::lock_guard<std::mutex> lock(state_.mutex_);
            return state_.running_ == 0;
        }

        bool await_suspend(std::coroutine_handle<> h) {
            std::lock_guard<std::mutex> lock(state_.mutex_);
            if (state_.running_ == 0) {
                return false;
            }
            state_.waiters_.push_back(h);
            return true;
        }

        void await_resume() noexcept {}

       private:
        GroupState& state_;
    };

    // Completes once no unit is running. Trivially ready before any launch.
    SettleAwaitable Settle() { return SettleAwaitable(*this); }

   private:
    std::string name_;
    CancellationSource cancel_;

    mutable std::mutex mutex_;
    size_t running_ = 0;
    Error first_error_;
    std::vector<std::coroutine_handle<>> waiters_;
};

template <typename F>
Task<void> RunUnit(std::shared_ptr<GroupState> state, F fn) {
    Error err;
    if constexpr (std::is_same_v<std::invoke_result_t<F&, CancellationToken>, Task<Error>>) {
        err = co_await std::invoke(fn, state->Token());
    } else {
        err = std::invoke(fn, state->Token());
    }
    if (err) {
        state->Fail(err);
    }
}

}  // namespace detail

class TaskGroup {
   public:
    struct Options {
        // Appears in log messages.
        std::string name = "task-group";
        ErrorPrecedence precedence = ErrorPrecedence::TaskError;

        Options() = default;
    };

    explicit TaskGroup(Executor& executor);
    TaskGroup(Executor& executor, Options options);

    // Cancels units that are still running (and logs it); they finish on
    // their own afterwards. Wait() before destroying to join them.
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    // Launches the units in order and returns how many actually started.
    // Callables skipped because the group is cancelled are never invoked.
    template <UnitFunction... Fns>
    size_t Go(Fns&&... fns) {
        size_t launched = 0;
        ((launched += Launch(std::forward<Fns>(fns)) ? 1 : 0), ...);
        return launched;
    }

    // Idempotent; never turns into an error reported by Wait().
    void Cancel();

    // Joins every unit. Returns, in order of precedence: the first unit
    // error; the reason of `wait_ctx` if it fired before the group settled;
    // an empty Error. ErrorPrecedence::WaitError swaps the first two.
    Task<Error> Wait(CancellationToken wait_ctx = CancellationToken::None());

    // The deadline fires even while every worker of the executor is blocked
    // in a unit. Its timer is disarmed once Wait() returns.
    template <typename Rep, typename Period>
    Task<Error> WaitFor(std::chrono::duration<Rep, Period> timeout) {
        auto deadline = DeadlineSource::After(executor_, timeout);
        co_return co_await Wait(deadline.GetToken());
    }

    size_t Running() const { return state_->Running(); }

    bool IsCancelled() const noexcept { return state_->IsCancelled(); }

    // The token every unit receives.
    [[nodiscard]] CancellationToken Token() const { return state_->Token(); }

    const std::string& Name() const noexcept { return state_->Name(); }

    Executor& GetExecutor() const noexcept { return executor_; }

   private:
    template <typename F>
    bool Launch(F&& fn) {
        if (!state_->TryAcquire()) {
            return false;
        }
        auto detached = MakeDetached(detail::RunUnit<std::decay_t<F>>(state_, std::forward<F>(fn)));
        detached.SetCallback([state = state_] { state->Release(); });
        executor_.Schedule(detached.Release());
        return true;
    }

    Executor& executor_;
    Options options_;
    std::shared_ptr<detail::GroupState> state_;
};

}  // namespace cogroup
