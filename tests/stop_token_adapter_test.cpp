// ============================================================================
// std::stop_token Interop Tests
// ============================================================================

#include "cogroup/core/stop_token_adapter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <stop_token>
#include <thread>

using namespace cogroup;
using namespace std::chrono_literals;

TEST(StopTokenTest, FromStopTokenPropagates) {
    std::stop_source stop;
    auto bridged = FromStopToken(stop.get_token());

    EXPECT_TRUE(bridged.token.IsValid());
    EXPECT_FALSE(bridged.token.IsCancelled());

    stop.request_stop();
    EXPECT_TRUE(bridged.token.IsCancelled());
    EXPECT_EQ(bridged.token.Reason(), make_error_code(Errc::Cancelled));
}

TEST(StopTokenTest, FromAlreadyStoppedToken) {
    std::stop_source stop;
    stop.request_stop();

    auto bridged = FromStopToken(stop.get_token());
    EXPECT_TRUE(bridged.token.IsCancelled());
}

TEST(StopTokenTest, FromTokenThatCannotStop) {
    auto bridged = FromStopToken(std::stop_token{});
    EXPECT_TRUE(bridged.token.IsValid());
    EXPECT_FALSE(bridged.token.IsCancelled());
}

TEST(StopTokenTest, FromJthreadToken) {
    std::atomic<bool> observed{false};
    {
        std::jthread worker([&observed](std::stop_token st) {
            auto bridged = FromStopToken(st);
            while (!bridged.token.IsCancelled()) {
                std::this_thread::sleep_for(1ms);
            }
            observed = true;
        });
    }
    EXPECT_TRUE(observed.load());
}

TEST(StopTokenTest, LinkCancellationRequestsStop) {
    CancellationSource source;
    std::stop_source stop;
    auto link = LinkCancellation(source.GetToken(), stop);

    EXPECT_FALSE(stop.stop_requested());
    source.Cancel();
    EXPECT_TRUE(stop.stop_requested());
}

TEST(StopTokenTest, LinkCancellationWakesConditionVariable) {
    CancellationSource source;
    std::atomic<bool> woke{false};

    std::thread blocked([&] {
        std::stop_source stop;
        auto link = LinkCancellation(source.GetToken(), stop);
        std::mutex mu;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, stop.get_token(), [] { return false; });
        woke = true;
    });

    std::this_thread::sleep_for(10ms);
    source.Cancel();
    blocked.join();
    EXPECT_TRUE(woke.load());
}

TEST(StopTokenTest, DroppedLinkDoesNothing) {
    CancellationSource source;
    std::stop_source stop;
    {
        auto link = LinkCancellation(source.GetToken(), stop);
    }
    source.Cancel();
    EXPECT_FALSE(stop.stop_requested());
}
