// ============================================================================
// cogroup/cogroup.hpp - Main Include Header
// ============================================================================

#pragma once

// Core
#include "cogroup/core/cancellation.hpp"
#include "cogroup/core/deadline.hpp"
#include "cogroup/core/detached_task.hpp"
#include "cogroup/core/error.hpp"
#include "cogroup/core/log.hpp"
#include "cogroup/core/result.hpp"
#include "cogroup/core/stop_token_adapter.hpp"
#include "cogroup/core/task.hpp"
#include "cogroup/core/task_group.hpp"

// Executors
#include "cogroup/io/executor.hpp"
#include "cogroup/io/libuv_executor.hpp"
#include "cogroup/io/thread_pool_executor.hpp"
#include "cogroup/io/timer.hpp"

// Synchronization
#include "cogroup/sync/event.hpp"
#include "cogroup/sync/sync_wait.hpp"
