// ============================================================================
// cogroup/io/executor.cpp - Current Executor Tracking
// ============================================================================

#include "cogroup/io/executor.hpp"

namespace cogroup {

static thread_local Executor* g_current_executor = nullptr;

Executor* GetCurrentExecutor() {
    return g_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    g_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(g_current_executor) {
    g_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    g_current_executor = previous_;
}

}  // namespace cogroup
