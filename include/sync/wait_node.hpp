#ifndef TASKSYNC_SYNC_WAIT_NODE_HPP
#define TASKSYNC_SYNC_WAIT_NODE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "completion_source.hpp"

namespace tasksync {

class wait_node;

// Owner of the queue a wait node is linked into
class wait_queue_owner {
public:
  // A linked node was completed by its racer and its result consumed.
  // The owner unlinks it and re-examines its queue.
  virtual void on_abandoned_node_consumed(wait_node &node) = 0;

protected:
  ~wait_queue_owner() = default;
};

// =============================================================================
// Wait Node - One suspended caller of a queued primitive
// =============================================================================
//
// A completion source of bool that can be linked into a wait queue and is
// recycled through a pool once its result has been consumed. Timeouts yield
// false unless the node is configured to throw.

class wait_node : public value_completion_source<bool> {
public:
  using back_to_pool_fn = std::function<void(wait_node &)>;

  explicit wait_node(bool run_continuations_asynchronously)
      : value_completion_source<bool>(run_continuations_asynchronously) {}

  void set_back_to_pool(back_to_pool_fn fn) { back_to_pool_ = std::move(fn); }

  void throw_on_timeout(bool value) noexcept { throw_on_timeout_ = value; }

  bool is_linked() const noexcept {
    return owner_.load(std::memory_order_acquire) != nullptr;
  }

protected:
  void store_timeout_outcome() override {
    if (throw_on_timeout_)
      value_completion_source<bool>::store_timeout_outcome();
    else
      payload().set_value(false);
  }

  void after_consumed() override {
    if (auto *owner = owner_.load(std::memory_order_acquire))
      owner->on_abandoned_node_consumed(*this);

    reset();
    if (back_to_pool_)
      back_to_pool_(*this);
  }

private:
  template <typename, typename, typename> friend class queued_synchronizer;

  // Queue links, guarded by the owner's lock. next_ owns the successor.
  std::shared_ptr<wait_node> next_;
  wait_node *prev_{nullptr};
  std::atomic<wait_queue_owner *> owner_{nullptr};

  bool throw_on_timeout_{true};
  back_to_pool_fn back_to_pool_;
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_WAIT_NODE_HPP
