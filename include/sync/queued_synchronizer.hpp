#ifndef TASKSYNC_SYNC_QUEUED_SYNCHRONIZER_HPP
#define TASKSYNC_SYNC_QUEUED_SYNCHRONIZER_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <memory_resource>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "../allocator.hpp"
#include "../cancellation.hpp"
#include "completion_source.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "errors.hpp"
#include "policies.hpp"
#include "value_task.hpp"
#include "wait_node.hpp"
#include "wait_node_pool.hpp"

namespace tasksync {

// =============================================================================
// Resumption Batch - Resumptions collected inside a critical section
// =============================================================================
//
// Backed by a small in-place arena that spills into mimalloc. Declare the
// batch before the lock guard so it is run after the lock is released.

class resumption_batch {
public:
  resumption_batch()
      : arena_(buffer_.data(), buffer_.size(), mi_resource()),
        items_(&arena_) {}

  ~resumption_batch() { run(); }

  resumption_batch(const resumption_batch &) = delete;
  resumption_batch &operator=(const resumption_batch &) = delete;

  void add(resumption r) { items_.push_back(std::move(r)); }

  void add(std::optional<resumption> r) {
    if (r)
      items_.push_back(std::move(*r));
  }

  std::size_t size() const noexcept { return items_.size(); }

  // A resumption that fails to dispatch is logged; the rest still run
  void run() noexcept {
    auto items = std::move(items_);
    items_ = std::pmr::vector<resumption>(&arena_);
    for (auto &r : items) {
      try {
        r.run();
      } catch (const std::exception &e) {
        LOG(ERROR) << "resumption of a granted waiter failed: " << e.what();
      }
    }
  }

private:
  std::array<std::byte, 512> buffer_;
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::vector<resumption> items_;
};

// =============================================================================
// Queued Synchronizer - FIFO wait queue shared by asynchronous primitives
// =============================================================================
//
// Derived must provide (called with the lock held):
//   void drain_wait_queue(resumption_batch &batch)
//     Walk the queue from the head and grant every node the current state
//     allows, stopping at the first one that must keep waiting.
//   bool is_ready_to_dispose() const
//     True when no caller holds the primitive.
//   static const char *object_name()
//
// Derived must only touch its state while holding mutex_, and never run a
// continuation there: completions go through a resumption_batch.

template <typename Derived, typename Node, typename LockPolicy>
class queued_synchronizer : public wait_queue_owner,
                            public disposable_mixin<Derived> {
  static_assert(GuardPolicy<LockPolicy>);
  static_assert(std::is_base_of_v<wait_node, Node>);

public:
  queued_synchronizer(const queued_synchronizer &) = delete;
  queued_synchronizer &operator=(const queued_synchronizer &) = delete;

  // Fails every queued waiter with object_disposed_error. Further requests
  // throw object_disposed_error.
  void dispose() {
    resumption_batch batch;
    {
      lock_type lock(mutex_);
      if (this->is_disposed())
        return;
      dispose_locked(batch);
    }
    batch.run();
  }

  // Rejects new requests at once; completes once nobody holds the
  // primitive any more.
  value_task<void> dispose_async() {
    resumption_batch batch;
    value_task<void> result;
    {
      lock_type lock(mutex_);
      if (this->is_disposed())
        return value_task<void>::from_result();

      auto waiter = std::make_shared<value_completion_source<void>>(
          options_.run_continuations_asynchronously);
      auto token = waiter->prepare_wait(infinite_timeout);
      result = value_task<void>(waiter, *token);
      dispose_waiters_.push_back(std::move(waiter));

      if (this->request_dispose())
        VLOG(1) << Derived::object_name() << ": dispose requested";
      complete_dispose_if_quiescent(batch);
    }
    batch.run();
    return result;
  }

  bool has_waiters() const {
    lock_type lock(mutex_);
    return head_ != nullptr;
  }

  std::size_t queue_length() const {
    lock_type lock(mutex_);
    return queue_length_;
  }

protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  explicit queued_synchronizer(const async_lock_options &options)
      : options_(options), pool_(make_wait_node_pool<Node>(options)) {}

  ~queued_synchronizer() {
    if (this->is_disposed())
      return;

    resumption_batch batch;
    {
      lock_type lock(mutex_);
      if (head_)
        LOG(WARNING) << Derived::object_name() << " destroyed with "
                     << queue_length_ << " queued waiter(s)";
      dispose_locked(batch);
    }
    batch.run();
  }

  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

  // Common acquisition path:
  //   try_acquire() succeeds    -> completed task
  //   timeout == 0              -> false, or timeout_error
  //   token already cancelled   -> cancelled_exception
  //   otherwise                 -> rent, arm and enqueue a node
  // try_acquire and configure run with the lock held.
  template <typename TryAcquire, typename Configure>
  value_task<bool> wait_async(TryAcquire &&try_acquire, Configure &&configure,
                              std::chrono::milliseconds timeout,
                              const cancellation_token &token,
                              bool throw_on_timeout) {
    validate_timeout(timeout);

    lock_type lock(mutex_);
    this->throw_if_dispose_requested();

    if (try_acquire())
      return value_task<bool>::from_result(true);

    if (timeout == std::chrono::milliseconds::zero()) {
      if (throw_on_timeout)
        return value_task<bool>::from_exception(
            std::make_exception_ptr(timeout_error{}));
      return value_task<bool>::from_result(false);
    }

    if (token.is_cancelled())
      return value_task<bool>::from_exception(
          std::make_exception_ptr(cancelled_exception{}));

    auto node = pool_->rent();
    node->throw_on_timeout(throw_on_timeout);
    configure(*node);

    auto version = node->prepare_wait(timeout, token);
    if (!version)
      throw invalid_operation_error(error_messages::invalid_source_state);

    // A cancellation racing the registration completes the node at once;
    // such a node never enters the queue
    if (!node->is_completed())
      enqueue(node);

    return value_task<bool>(std::move(node), *version);
  }

  // Release path: grant what the new state allows, then finish a pending
  // dispose. Lock held.
  void on_state_changed(resumption_batch &batch) {
    derived().drain_wait_queue(batch);
    complete_dispose_if_quiescent(batch);
  }

  Node *first_waiter() const noexcept { return static_cast<Node *>(head_.get()); }

  static Node *next_waiter(const Node &node) noexcept {
    return static_cast<Node *>(node.next_.get());
  }

  // Runs `commit`, completes `node` with true and unlinks it. False (and
  // `commit` not run) if the node was already completed by its racer.
  template <typename Commit>
  bool grant(Node &node, resumption_batch &batch, Commit &&commit) {
    auto r = node.try_commit_result_deferred(std::forward<Commit>(commit), true);
    unlink(node);
    if (!r)
      return false;
    batch.add(std::move(*r));
    return true;
  }

  // Unlinks `node`. The node may be destroyed by this call.
  bool unlink(wait_node &node) {
    if (node.owner_.load(std::memory_order_relaxed) != this)
      return false;

    wait_node *prev = node.prev_;
    std::shared_ptr<wait_node> next = std::move(node.next_);
    std::shared_ptr<wait_node> self;

    if (next)
      next->prev_ = prev;
    else
      tail_ = prev;

    if (prev) {
      self = std::move(prev->next_);
      prev->next_ = std::move(next);
    } else {
      self = std::move(head_);
      head_ = std::move(next);
    }

    node.prev_ = nullptr;
    node.owner_.store(nullptr, std::memory_order_release);
    --queue_length_;
    return true;
  }

  const async_lock_options &options() const noexcept { return options_; }

  mutable mutex_type mutex_;

private:
  void enqueue(std::shared_ptr<Node> node) {
    wait_node *raw = node.get();
    raw->owner_.store(this, std::memory_order_release);
    raw->prev_ = tail_;
    raw->next_.reset();

    if (tail_)
      tail_->next_ = std::move(node);
    else
      head_ = std::move(node);

    tail_ = raw;
    ++queue_length_;
  }

  void on_abandoned_node_consumed(wait_node &node) override {
    resumption_batch batch;
    {
      lock_type lock(mutex_);
      if (!unlink(node))
        return;
      VLOG(2) << Derived::object_name() << ": dropped abandoned waiter, "
              << queue_length_ << " still queued";
      on_state_changed(batch);
    }
    batch.run();
  }

  void complete_dispose_if_quiescent(resumption_batch &batch) {
    if (this->is_dispose_requested() && !this->is_disposed() &&
        derived().is_ready_to_dispose())
      dispose_locked(batch);
  }

  void dispose_locked(resumption_batch &batch) {
    this->mark_disposed();

    if (queue_length_ != 0)
      VLOG(1) << Derived::object_name() << ": failing " << queue_length_
              << " queued waiter(s) on dispose";

    while (head_) {
      auto &node = *head_;
      auto r = node.try_set_exception_deferred(
          std::make_exception_ptr(object_disposed_error(Derived::object_name())));
      unlink(node);
      batch.add(std::move(r));
    }

    for (auto &waiter : dispose_waiters_)
      batch.add(waiter->try_set_result_deferred());
    dispose_waiters_.clear();
  }

  const async_lock_options options_;
  std::unique_ptr<wait_node_supplier<Node>> pool_;

  std::shared_ptr<wait_node> head_;
  wait_node *tail_{nullptr};
  std::size_t queue_length_{0};

  std::vector<std::shared_ptr<value_completion_source<void>>> dispose_waiters_;
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_QUEUED_SYNCHRONIZER_HPP
