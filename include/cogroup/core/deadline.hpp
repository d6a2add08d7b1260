// ============================================================================
// cogroup/core/deadline.hpp - Deadline-Bearing Cancellation
// ============================================================================
//
// DeadlineSource is a cancellation source that fires by itself, with reason
// Errc::DeadlineExceeded, once its deadline passes. Its token is what a
// caller hands to TaskGroup::Wait to bound how long it is willing to wait:
//
//   auto deadline = DeadlineSource::After(executor, 2s);
//   Error err = co_await group.Wait(deadline.GetToken());
//   // err == Errc::DeadlineExceeded if the group had to be cut short
//
// The timer is an Executor::PostAfter callback, so it fires even when every
// worker of the executor is busy. A deadline already in the past fires during
// construction. Cancel() fires early with Errc::Cancelled and disarms the
// timer; so does destroying the source. The executor must outlive the
// DeadlineSource.
//
// ============================================================================

#pragma once

#include "cogroup/core/cancellation.hpp"
#include "cogroup/io/executor.hpp"

#include <chrono>

namespace cogroup {

class DeadlineSource {
   public:
    using Clock = std::chrono::steady_clock;

    DeadlineSource(Executor& executor, Clock::time_point deadline);

    template <typename Rep, typename Period>
    static DeadlineSource After(Executor& executor, std::chrono::duration<Rep, Period> timeout) {
        return DeadlineSource(executor, Clock::now() + std::chrono::ceil<Clock::duration>(timeout));
    }

    ~DeadlineSource();

    DeadlineSource(DeadlineSource&& other) noexcept;
    DeadlineSource& operator=(DeadlineSource&& other) noexcept;
    DeadlineSource(const DeadlineSource&) = delete;
    DeadlineSource& operator=(const DeadlineSource&) = delete;

    [[nodiscard]] CancellationToken GetToken() const { return source_.GetToken(); }

    bool Cancel();

    bool IsCancelled() const noexcept { return source_.IsCancelled(); }

    bool IsExpired() const { return source_.Reason() == make_error_code(Errc::DeadlineExceeded); }

    Clock::time_point Deadline() const noexcept { return deadline_; }

   private:
    void Disarm();

    CancellationSource source_;
    Clock::time_point deadline_;
    Executor* executor_ = nullptr;
    Executor::TimerId timer_id_ = 0;
};

}  // namespace cogroup
