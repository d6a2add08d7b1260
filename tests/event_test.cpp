// ============================================================================
// AsyncEvent Tests
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "cogroup/core/task.hpp"
#include "cogroup/sync/event.hpp"
#include "cogroup/sync/sync_wait.hpp"

using namespace cogroup;

TEST(AsyncEventTest, SetAndReset) {
    AsyncEvent event;
    EXPECT_FALSE(event.IsSet());

    event.Set();
    event.Set();
    EXPECT_TRUE(event.IsSet());

    event.Reset();
    EXPECT_FALSE(event.IsSet());
}

TEST(AsyncEventTest, WaitOnAlreadySetPassesThrough) {
    AsyncEvent event;
    event.Set();

    auto task = [&]() -> Task<int> {
        co_await event.Wait();
        co_await event.Wait();
        co_return 42;
    };

    EXPECT_EQ(SyncWait(task()), 42);
}

TEST(AsyncEventTest, MultipleWaitersAllResumed) {
    AsyncEvent event;
    std::atomic<int> count{0};

    auto make_waiter = [&]() -> Task<void> {
        co_await event.Wait();
        count.fetch_add(1);
    };

    auto w1 = make_waiter();
    auto w2 = make_waiter();
    auto w3 = make_waiter();
    w1.GetHandle().resume();
    w2.GetHandle().resume();
    w3.GetHandle().resume();
    EXPECT_EQ(count.load(), 0);

    event.Set();
    EXPECT_EQ(count.load(), 3);
}

TEST(AsyncEventTest, ResetAndReuse) {
    AsyncEvent event;
    std::atomic<int> count{0};

    auto make_waiter = [&]() -> Task<void> {
        co_await event.Wait();
        count.fetch_add(1);
    };

    auto w1 = make_waiter();
    w1.GetHandle().resume();
    event.Set();
    EXPECT_EQ(count.load(), 1);

    event.Reset();

    auto w2 = make_waiter();
    w2.GetHandle().resume();
    EXPECT_EQ(count.load(), 1);
    event.Set();
    EXPECT_EQ(count.load(), 2);
}

TEST(AsyncEventTest, CrossThreadSetAndWait) {
    AsyncEvent event;
    std::atomic<bool> done{false};

    auto waiter = [&]() -> Task<void> {
        co_await event.Wait();
        done.store(true);
    };

    auto task = waiter();
    task.GetHandle().resume();

    std::thread setter([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        event.Set();
    });
    setter.join();

    EXPECT_TRUE(done.load());
}
