#ifndef TASKSYNC_SYNC_ASYNC_RW_LOCK_HPP
#define TASKSYNC_SYNC_ASYNC_RW_LOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

#include <glog/logging.h>

#include "../cancellation.hpp"
#include "completion_source.hpp"
#include "errors.hpp"
#include "policies.hpp"
#include "queued_synchronizer.hpp"
#include "value_task.hpp"
#include "wait_node.hpp"

namespace tasksync {

enum class lock_mode : std::uint8_t { read, upgrade, exclusive };

// Awaitable lock acquisition. Throws timeout_error or cancelled_exception.
using lock_task = value_task<void, bool>;

// Awaitable lock acquisition yielding false on timeout
using try_lock_task = value_task<bool>;

template <typename LockPolicy> class basic_async_rw_lock;

// Optimistic read token: the write epoch observed by try_optimistic_read()
class lock_stamp {
public:
  lock_stamp() = default;

  bool valid() const noexcept { return valid_; }

  std::int64_t version() const noexcept { return version_; }

  friend bool operator==(const lock_stamp &, const lock_stamp &) = default;

private:
  template <typename> friend class basic_async_rw_lock;

  lock_stamp(std::int64_t version, bool valid) noexcept
      : version_(version), valid_(valid) {}

  std::int64_t version_{0};
  bool valid_{false};
};

class rw_wait_node : public wait_node {
public:
  using wait_node::wait_node;

  lock_mode mode() const noexcept { return mode_; }

  void set_mode(lock_mode mode) noexcept { mode_ = mode; }

private:
  lock_mode mode_{lock_mode::read};
};

// =============================================================================
// Async RW Lock - Upgradeable reader/writer lock with FIFO wait queue
// =============================================================================
//
// Three acquisition modes:
//   read       allowed while no writer holds the lock
//   exclusive  allowed while nobody holds the lock
//   upgrade    read -> exclusive, allowed while the caller is the only reader
//
// Every exclusive acquisition (upgrades included) bumps the write epoch, which
// is what lock_stamp validation compares against.
//
// Fast paths barge: a synchronous acquisition may overtake queued waiters.
// Queued waiters are granted in FIFO order; an upgrade or exclusive request
// at the head blocks everything behind it, a run of read requests at the head
// is granted together.
//
// Usage:
//   async_rw_lock lock;
//   co_await lock.enter_read_lock_async();
//   ... read ...
//   lock.release();

template <typename LockPolicy = mutex_lock_policy>
class basic_async_rw_lock final
    : public queued_synchronizer<basic_async_rw_lock<LockPolicy>, rw_wait_node,
                                 LockPolicy> {
  using base = queued_synchronizer<basic_async_rw_lock<LockPolicy>,
                                   rw_wait_node, LockPolicy>;
  using typename base::lock_type;

  friend base;

public:
  basic_async_rw_lock() : basic_async_rw_lock(async_lock_options{}) {}

  explicit basic_async_rw_lock(const async_lock_options &options)
      : base(options) {}

  static const char *object_name() noexcept { return "async_rw_lock"; }

  // ---------------------------------------------------------------------------
  // Read
  // ---------------------------------------------------------------------------

  bool try_enter_read_lock() {
    lock_type lock(this->mutex_);
    this->throw_if_dispose_requested();
    return try_acquire(lock_mode::read);
  }

  lock_task enter_read_lock_async(std::chrono::milliseconds timeout = infinite_timeout,
                                  const cancellation_token &token = {}) {
    return acquire_async(lock_mode::read, timeout, token, true).discard_value();
  }

  lock_task enter_read_lock_async(const cancellation_token &token) {
    return enter_read_lock_async(infinite_timeout, token);
  }

  try_lock_task try_enter_read_lock_async(std::chrono::milliseconds timeout,
                                          const cancellation_token &token = {}) {
    return acquire_async(lock_mode::read, timeout, token, false);
  }

  // ---------------------------------------------------------------------------
  // Exclusive
  // ---------------------------------------------------------------------------

  bool try_enter_write_lock() {
    lock_type lock(this->mutex_);
    this->throw_if_dispose_requested();
    return try_acquire(lock_mode::exclusive);
  }

  // Acquires the write lock only if no write lock was taken since `stamp`
  bool try_enter_write_lock(const lock_stamp &stamp) {
    lock_type lock(this->mutex_);
    this->throw_if_dispose_requested();
    return validate_locked(stamp) && try_acquire(lock_mode::exclusive);
  }

  lock_task enter_write_lock_async(std::chrono::milliseconds timeout = infinite_timeout,
                                   const cancellation_token &token = {}) {
    return acquire_async(lock_mode::exclusive, timeout, token, true)
        .discard_value();
  }

  lock_task enter_write_lock_async(const cancellation_token &token) {
    return enter_write_lock_async(infinite_timeout, token);
  }

  try_lock_task try_enter_write_lock_async(std::chrono::milliseconds timeout,
                                           const cancellation_token &token = {}) {
    return acquire_async(lock_mode::exclusive, timeout, token, false);
  }

  // ---------------------------------------------------------------------------
  // Upgrade (caller must hold a read lock)
  // ---------------------------------------------------------------------------

  bool try_upgrade_to_write_lock() {
    lock_type lock(this->mutex_);
    this->throw_if_dispose_requested();
    throw_if_no_read_lock();
    return try_acquire(lock_mode::upgrade);
  }

  lock_task upgrade_to_write_lock_async(std::chrono::milliseconds timeout = infinite_timeout,
                                        const cancellation_token &token = {}) {
    return acquire_async(lock_mode::upgrade, timeout, token, true).discard_value();
  }

  lock_task upgrade_to_write_lock_async(const cancellation_token &token) {
    return upgrade_to_write_lock_async(infinite_timeout, token);
  }

  try_lock_task try_upgrade_to_write_lock_async(std::chrono::milliseconds timeout,
                                                const cancellation_token &token = {}) {
    return acquire_async(lock_mode::upgrade, timeout, token, false);
  }

  // ---------------------------------------------------------------------------
  // Release / downgrade
  // ---------------------------------------------------------------------------

  // Releases the write lock, or one read lock
  void release() {
    resumption_batch batch;
    {
      lock_type lock(this->mutex_);
      this->throw_if_disposed();
      if (exclusive_.load(std::memory_order_relaxed)) {
        release_write();
      } else if (readers_.load(std::memory_order_relaxed) > 0) {
        readers_.fetch_sub(1, std::memory_order_release);
      } else {
        throw synchronization_lock_error();
      }
      this->on_state_changed(batch);
    }
    batch.run();
  }

  // Write lock -> read lock, without letting a writer in between
  void downgrade_from_write_lock() {
    resumption_batch batch;
    {
      lock_type lock(this->mutex_);
      this->throw_if_disposed();
      if (!exclusive_.load(std::memory_order_relaxed))
        throw synchronization_lock_error();
      readers_.store(1, std::memory_order_release);
      exclusive_.store(false, std::memory_order_release);
      VLOG(2) << object_name() << ": downgraded to read lock";
      this->on_state_changed(batch);
    }
    batch.run();
  }

  // ---------------------------------------------------------------------------
  // Optimistic read
  // ---------------------------------------------------------------------------

  // Stamp of the current write epoch. Not valid while a writer holds the lock.
  lock_stamp try_optimistic_read() {
    lock_type lock(this->mutex_);
    this->throw_if_disposed();
    return lock_stamp(write_epoch_.load(std::memory_order_relaxed),
                      !exclusive_.load(std::memory_order_relaxed));
  }

  // True if no write lock was acquired since `stamp` was taken. Lock-free.
  bool validate(const lock_stamp &stamp) const {
    this->throw_if_disposed();
    std::atomic_thread_fence(std::memory_order_acquire);
    return validate_locked(stamp);
  }

  // ---------------------------------------------------------------------------
  // Observers
  // ---------------------------------------------------------------------------

  std::int64_t current_read_count() const noexcept {
    return readers_.load(std::memory_order_acquire);
  }

  bool is_read_lock_held() const noexcept { return current_read_count() > 0; }

  bool is_write_lock_held() const noexcept {
    return exclusive_.load(std::memory_order_acquire);
  }

  std::int64_t write_epoch() const noexcept {
    return write_epoch_.load(std::memory_order_acquire);
  }

private:
  try_lock_task acquire_async(lock_mode mode, std::chrono::milliseconds timeout,
                              const cancellation_token &token,
                              bool throw_on_timeout) {
    return this->wait_async(
        [this, mode] {
          if (mode == lock_mode::upgrade)
            throw_if_no_read_lock();
          return try_acquire(mode);
        },
        [mode](rw_wait_node &node) { node.set_mode(mode); }, timeout, token,
        throw_on_timeout);
  }

  // Lock held from here on

  bool is_allowed(lock_mode mode) const noexcept {
    const bool exclusive = exclusive_.load(std::memory_order_relaxed);
    const auto readers = readers_.load(std::memory_order_relaxed);
    switch (mode) {
    case lock_mode::read:
      return !exclusive;
    case lock_mode::upgrade:
      return !exclusive && readers == 1;
    case lock_mode::exclusive:
      return !exclusive && readers == 0;
    }
    return false;
  }

  void commit(lock_mode mode) noexcept {
    if (mode == lock_mode::read) {
      readers_.fetch_add(1, std::memory_order_release);
      return;
    }

    // Upgrade gives up the caller's own read lock
    readers_.store(0, std::memory_order_relaxed);
    exclusive_.store(true, std::memory_order_relaxed);
    write_epoch_.fetch_add(1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);
  }

  bool try_acquire(lock_mode mode) noexcept {
    if (!is_allowed(mode))
      return false;
    commit(mode);
    return true;
  }

  void release_write() noexcept {
    readers_.store(0, std::memory_order_relaxed);
    exclusive_.store(false, std::memory_order_release);
  }

  void throw_if_no_read_lock() const {
    if (exclusive_.load(std::memory_order_relaxed) ||
        readers_.load(std::memory_order_relaxed) == 0)
      throw synchronization_lock_error();
  }

  bool validate_locked(const lock_stamp &stamp) const noexcept {
    return stamp.valid() &&
           stamp.version() == write_epoch_.load(std::memory_order_relaxed);
  }

  // Called by queued_synchronizer

  void drain_wait_queue(resumption_batch &batch) {
    for (auto *node = this->first_waiter(); node != nullptr;) {
      auto *next = this->next_waiter(*node);

      if (node->is_completed()) {
        // Canceled or timed out while queued
        this->unlink(*node);
        node = next;
        continue;
      }

      const auto mode = node->mode();
      if (!is_allowed(mode))
        return;

      if (this->grant(*node, batch, [this, mode] { commit(mode); })) {
        VLOG(2) << object_name() << ": granted queued "
                << (mode == lock_mode::read ? "read" : "write") << " request";
        if (mode != lock_mode::read)
          return;
      }
      node = next;
    }
  }

  bool is_ready_to_dispose() const noexcept {
    return !exclusive_.load(std::memory_order_relaxed) &&
           readers_.load(std::memory_order_relaxed) == 0;
  }

  // Written with the lock held; atomic for lock-free observers
  std::atomic<std::int64_t> write_epoch_{std::numeric_limits<std::int64_t>::min()};
  std::atomic<std::int64_t> readers_{0};
  std::atomic<bool> exclusive_{false};
};

using async_rw_lock = basic_async_rw_lock<mutex_lock_policy>;

} // namespace tasksync

#endif // TASKSYNC_SYNC_ASYNC_RW_LOCK_HPP
