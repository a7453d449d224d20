#ifndef TASKSYNC_HPP
#define TASKSYNC_HPP

// =============================================================================
// Tasksync - Asynchronous synchronization primitives
// =============================================================================
//
// Primitives that suspend logical callers instead of blocking threads, with
// cooperative cancellation, timeouts and pooled bookkeeping.
//
// Building blocks:
// - manual_reset_completion_source / value_completion_source: reusable
//   "completes later" objects guarded by an (epoch, status) word
// - value_task: awaitable consumer side of a completion source
// - wait_node + pools: pooled completion sources linked into wait queues
// - queued_synchronizer: FIFO wait queue, drain protocol, disposal
//
// Primitives:
// - async_rw_lock: upgradeable reader/writer lock with optimistic stamps
//
// =============================================================================

// Runtime services
#include "allocator.hpp"
#include "cancellation.hpp"
#include "coro_task.hpp"
#include "execution_context.hpp"
#include "task_scheduler.hpp"
#include "timer_service.hpp"

// Foundation headers
#include "sync/concepts.hpp"
#include "sync/crtp_base.hpp"
#include "sync/errors.hpp"
#include "sync/policies.hpp"

// Completion sources and queues
#include "sync/completion_source.hpp"
#include "sync/continuation.hpp"
#include "sync/queued_synchronizer.hpp"
#include "sync/value_task.hpp"
#include "sync/wait_node.hpp"
#include "sync/wait_node_pool.hpp"

// Primitive headers
#include "sync/async_rw_lock.hpp"

#endif // TASKSYNC_HPP
