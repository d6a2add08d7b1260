// ============================================================================
// Thread Pool Executor Tests
// ============================================================================

#include "cogroup/core/task.hpp"
#include "cogroup/io/thread_pool_executor.hpp"
#include "cogroup/io/timer.hpp"
#include "cogroup/sync/sync_wait.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <latch>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace cogroup;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, CreateAndDestroy) {
    ThreadPoolExecutor executor(2);
    EXPECT_EQ(executor.NumThreads(), 2u);
    EXPECT_TRUE(executor.IsRunning());
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPoolExecutor::Options options;
    options.num_threads = 0;
    options.thread_name_prefix = "zero";
    ThreadPoolExecutor executor(options);
    EXPECT_EQ(executor.NumThreads(), 1u);
}

TEST(ThreadPoolTest, StopClearsRunning) {
    ThreadPoolExecutor executor(1);
    executor.Stop();
    EXPECT_FALSE(executor.IsRunning());
}

TEST(ThreadPoolTest, RunReturnsWhenDrained) {
    ThreadPoolExecutor executor(4);
    std::atomic<int> counter{0};
    const int num_tasks = 100;

    for (int i = 0; i < num_tasks; ++i) {
        executor.Post([&counter] { counter++; });
    }

    executor.Run();
    EXPECT_EQ(counter.load(), num_tasks);
    EXPECT_EQ(executor.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, RunReturnsOnStop) {
    ThreadPoolExecutor executor(2);
    executor.Post([&executor] { executor.Stop(); });
    executor.Run();
    EXPECT_FALSE(executor.IsRunning());
}

TEST(ThreadPoolTest, ScheduleCoroutine) {
    ThreadPoolExecutor executor(2);
    std::atomic<int> value{0};

    auto task = [&]() -> Task<void> {
        value = 42;
        co_return;
    };

    auto t = task();
    executor.Schedule(t.GetHandle());
    executor.Run();

    EXPECT_EQ(value.load(), 42);
}

TEST(ThreadPoolTest, ParallelExecution) {
    ThreadPoolExecutor executor(4);
    std::mutex mutex;
    std::set<std::thread::id> thread_ids;
    std::latch all_in{4};

    for (int i = 0; i < 4; ++i) {
        executor.Post([&]() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                thread_ids.insert(std::this_thread::get_id());
            }
            // Only completes if all four run at the same time.
            all_in.arrive_and_wait();
        });
    }

    executor.Run();
    EXPECT_EQ(thread_ids.size(), 4u);
}

TEST(ThreadPoolTest, WorkersAreCurrentExecutor) {
    ThreadPoolExecutor executor(2);
    std::atomic<Executor*> seen{nullptr};

    executor.Post([&seen] { seen = GetCurrentExecutor(); });
    executor.Run();

    EXPECT_EQ(seen.load(), &executor);
    EXPECT_EQ(GetCurrentExecutor(), nullptr);
}

TEST(ThreadPoolTest, ScheduleAfterDelay) {
    ThreadPoolExecutor executor(2);

    auto task = [&]() -> Task<std::chrono::steady_clock::duration> {
        auto start = std::chrono::steady_clock::now();
        co_await AsyncSleep(20ms, &executor);
        co_return std::chrono::steady_clock::now() - start;
    };

    EXPECT_GE(SyncWait(task()), 20ms);
}

TEST(ThreadPoolTest, DelayedHandlesFireInDeadlineOrder) {
    ThreadPoolExecutor executor(1);
    std::mutex mutex;
    std::vector<int> order;
    std::latch done{3};

    auto sleeper = [&](int id, std::chrono::milliseconds delay) -> Task<void> {
        co_await AsyncSleep(delay, &executor);
        {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(id);
        }
        done.count_down();
    };

    auto t1 = sleeper(1, 30ms);
    auto t2 = sleeper(2, 10ms);
    auto t3 = sleeper(3, 20ms);
    t1.GetHandle().resume();
    t2.GetHandle().resume();
    t3.GetHandle().resume();

    done.wait();
    executor.Run();
    EXPECT_EQ(order, (std::vector<int>{2, 3, 1}));
}

// ============================================================================
// PostAfter
// ============================================================================

TEST(ThreadPoolTest, PostAfterRunsWhileEveryWorkerIsBlocked) {
    ThreadPoolExecutor executor(1);
    std::atomic<bool> fired{false};
    std::latch released{1};

    executor.Post([&fired, &released] {
        while (!fired) {
            std::this_thread::sleep_for(1ms);
        }
        released.count_down();
    });
    auto id = executor.PostAfter(10ms, [&fired] { fired = true; });

    EXPECT_NE(id, 0u);
    released.wait();
    EXPECT_EQ(executor.PendingTimers(), 0u);
}

TEST(ThreadPoolTest, PostAfterEmptyCallbackIsIgnored) {
    ThreadPoolExecutor executor(1);
    EXPECT_EQ(executor.PostAfter(1ms, nullptr), 0u);
    EXPECT_EQ(executor.PendingTimers(), 0u);
    executor.CancelTimer(0);
}

TEST(ThreadPoolTest, CancelTimerDestroysCallback) {
    ThreadPoolExecutor executor(1);
    auto payload = std::make_shared<int>(7);
    std::weak_ptr<int> watch = payload;
    std::atomic<bool> fired{false};

    auto id = executor.PostAfter(20ms, [payload = std::move(payload), &fired] { fired = true; });
    EXPECT_EQ(executor.PendingTimers(), 1u);

    executor.CancelTimer(id);
    EXPECT_EQ(executor.PendingTimers(), 0u);
    EXPECT_TRUE(watch.expired());

    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(fired.load());
}

TEST(ThreadPoolTest, CancelTimerAfterFireIsNoop) {
    ThreadPoolExecutor executor(1);
    std::latch fired{1};

    auto id = executor.PostAfter(1ms, [&fired] { fired.count_down(); });
    fired.wait();

    executor.CancelTimer(id);
    executor.CancelTimer(id);
    EXPECT_EQ(executor.PendingTimers(), 0u);
}

// A long timer neither runs nor holds up destruction.
TEST(ThreadPoolTest, DestructorDropsPendingTimers) {
    auto payload = std::make_shared<int>(7);
    std::weak_ptr<int> watch = payload;
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    {
        ThreadPoolExecutor executor(1);
        executor.PostAfter(1h, [payload = std::move(payload), &fired] { fired = true; });
    }

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(watch.expired());
    EXPECT_FALSE(fired.load());
}
