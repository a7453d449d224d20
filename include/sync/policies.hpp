#ifndef TASKSYNC_SYNC_POLICIES_HPP
#define TASKSYNC_SYNC_POLICIES_HPP

#include <atomic>
#include <cstddef>
#include <mutex>

namespace tasksync {

// =============================================================================
// Lock Policies
// =============================================================================
//
// Selects the guard of a primitive's mutual-exclusion region. The region is
// only ever held for O(queue length) pointer work, never across a suspension.

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin with relaxed ordering for cache efficiency
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// =============================================================================
// Lock Options
// =============================================================================

// Runtime configuration shared by every queued primitive.
struct async_lock_options {
  // Maximum number of concurrently suspended callers. 0 selects the
  // grow-on-demand wait node pool.
  std::size_t concurrency_level = 0;

  // Dispatch continuations of granted waiters to the task scheduler instead
  // of running them on the releasing thread.
  bool run_continuations_asynchronously = true;
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_POLICIES_HPP
