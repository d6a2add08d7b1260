// ============================================================================
// TaskGroup Benchmarks
// ============================================================================
//
// BM_GroupGo measures launching no-op units into one long-lived group, the
// join happening once after the timed loop. BM_GroupGoWait pays for a full
// launch and join per iteration. Both run on a ThreadPoolExecutor and on the
// libuv loop.
//
// ============================================================================

#include <benchmark/benchmark.h>

#include "cogroup/core/log.hpp"
#include "cogroup/core/task.hpp"
#include "cogroup/core/task_group.hpp"
#include "cogroup/io/libuv_executor.hpp"
#include "cogroup/io/thread_pool_executor.hpp"
#include "cogroup/sync/sync_wait.hpp"

using namespace cogroup;

namespace {

Task<Error> Noop(CancellationToken) {
    co_return Error{};
}

}  // namespace

// ============================================================================
// Thread Pool
// ============================================================================

static void BM_GroupGo(benchmark::State& state) {
    SetLogLevel(LogLevel::Warn);
    ThreadPoolExecutor executor(static_cast<size_t>(state.range(0)));
    TaskGroup group(executor);

    for (auto _ : state) {
        group.Go(Noop);
    }

    Error err = SyncWait(group.Wait());
    benchmark::DoNotOptimize(err);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GroupGo)->Arg(1)->Arg(4)->UseRealTime();

static void BM_GroupGoWait(benchmark::State& state) {
    SetLogLevel(LogLevel::Warn);
    ThreadPoolExecutor executor(4);
    const int64_t units = state.range(0);

    for (auto _ : state) {
        TaskGroup group(executor);
        for (int64_t i = 0; i < units; ++i) {
            group.Go(Noop);
        }
        Error err = SyncWait(group.Wait());
        benchmark::DoNotOptimize(err);
    }
    state.SetItemsProcessed(state.iterations() * units);
}
BENCHMARK(BM_GroupGoWait)->Arg(1)->Arg(16)->Arg(256)->UseRealTime();

// Fan-out then cancel: every unit parks on the token until the group fails.
static void BM_GroupFailFast(benchmark::State& state) {
    SetLogLevel(LogLevel::Warn);
    ThreadPoolExecutor executor(4);
    const int64_t units = state.range(0);

    auto parked = [](CancellationToken token) -> Task<Error> {
        co_await token.Cancelled();
        co_return Error{};
    };

    for (auto _ : state) {
        TaskGroup group(executor);
        for (int64_t i = 0; i < units; ++i) {
            group.Go(parked);
        }
        group.Go([](CancellationToken) -> Task<Error> { co_return make_error_code(Errc::IoError); });
        Error err = SyncWait(group.Wait());
        benchmark::DoNotOptimize(err);
    }
    state.SetItemsProcessed(state.iterations() * (units + 1));
}
BENCHMARK(BM_GroupFailFast)->Arg(16)->Arg(256)->UseRealTime();

// ============================================================================
// Event Loop
// ============================================================================

static void BM_GroupGoWaitLoop(benchmark::State& state) {
    SetLogLevel(LogLevel::Warn);
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    const int64_t units = state.range(0);

    auto round = [&]() -> Task<void> {
        TaskGroup group(executor);
        for (int64_t i = 0; i < units; ++i) {
            group.Go(Noop);
        }
        Error err = co_await group.Wait();
        benchmark::DoNotOptimize(err);
        executor.Stop();
    };

    for (auto _ : state) {
        auto t = round();
        executor.Schedule(t.GetHandle());
        executor.Run();
    }
    state.SetItemsProcessed(state.iterations() * units);
}
BENCHMARK(BM_GroupGoWaitLoop)->Arg(1)->Arg(16)->Arg(256);

BENCHMARK_MAIN();
