#ifndef TASKSYNC_SYNC_WAIT_NODE_POOL_HPP
#define TASKSYNC_SYNC_WAIT_NODE_POOL_HPP

#include <cstddef>
#include <limits>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

#include "../allocator.hpp"
#include "errors.hpp"
#include "policies.hpp"
#include "wait_node.hpp"

namespace tasksync {

// =============================================================================
// Wait Node Supplier
// =============================================================================

template <typename Node> class wait_node_supplier {
  static_assert(std::is_base_of_v<wait_node, Node>);

public:
  virtual ~wait_node_supplier() = default;

  // A node in wait_for_activation, not linked into any queue
  virtual std::shared_ptr<Node> rent() = 0;

  // Nodes currently parked in the pool
  virtual std::size_t available() const = 0;
};

namespace detail {

// Parked nodes. Outlives the pool while rented nodes still point back to it.
template <typename Node> class node_free_list {
public:
  explicit node_free_list(std::size_t limit) : limit_(limit) {}

  void push(std::shared_ptr<Node> node) {
    std::lock_guard<spinlock> lock(lock_);
    if (nodes_.size() < limit_)
      nodes_.push_back(std::move(node));
  }

  std::shared_ptr<Node> pop() {
    std::lock_guard<spinlock> lock(lock_);
    if (nodes_.empty())
      return nullptr;
    auto node = std::move(nodes_.back());
    nodes_.pop_back();
    return node;
  }

  std::size_t size() const {
    std::lock_guard<spinlock> lock(lock_);
    return nodes_.size();
  }

private:
  mutable spinlock lock_;
  std::vector<std::shared_ptr<Node>> nodes_;
  const std::size_t limit_;
};

template <typename Node>
std::shared_ptr<Node> make_pooled_node(
    const std::shared_ptr<node_free_list<Node>> &list,
    bool run_continuations_asynchronously) {
  auto node = allocate_shared_node<Node>(run_continuations_asynchronously);
  node->set_back_to_pool([weak = std::weak_ptr<node_free_list<Node>>(list)](
                             wait_node &n) {
    if (auto target = weak.lock())
      target->push(std::static_pointer_cast<Node>(n.shared_from_this()));
  });
  return node;
}

} // namespace detail

// =============================================================================
// Bounded Wait Node Pool - Fixed set of nodes allocated up front
// =============================================================================

template <typename Node>
class bounded_wait_node_pool final : public wait_node_supplier<Node> {
public:
  bounded_wait_node_pool(std::size_t capacity,
                         bool run_continuations_asynchronously)
      : free_(std::make_shared<detail::node_free_list<Node>>(capacity)),
        capacity_(capacity) {
    for (std::size_t i = 0; i < capacity; ++i)
      free_->push(
          detail::make_pooled_node(free_, run_continuations_asynchronously));
  }

  // Throws pool_exhausted_error once every node is rented
  std::shared_ptr<Node> rent() override {
    auto node = free_->pop();
    if (!node)
      throw pool_exhausted_error();
    return node;
  }

  std::size_t available() const override { return free_->size(); }

  std::size_t capacity() const noexcept { return capacity_; }

private:
  std::shared_ptr<detail::node_free_list<Node>> free_;
  const std::size_t capacity_;
};

// =============================================================================
// Unbounded Wait Node Pool - Grows on demand, keeps returned nodes
// =============================================================================

template <typename Node>
class unbounded_wait_node_pool final : public wait_node_supplier<Node> {
public:
  explicit unbounded_wait_node_pool(bool run_continuations_asynchronously)
      : free_(std::make_shared<detail::node_free_list<Node>>(
            std::numeric_limits<std::size_t>::max())),
        run_continuations_asynchronously_(run_continuations_asynchronously) {}

  std::shared_ptr<Node> rent() override {
    if (auto node = free_->pop())
      return node;
    return detail::make_pooled_node(free_, run_continuations_asynchronously_);
  }

  std::size_t available() const override { return free_->size(); }

private:
  std::shared_ptr<detail::node_free_list<Node>> free_;
  const bool run_continuations_asynchronously_;
};

// concurrency_level == 0 selects the unbounded pool
template <typename Node>
std::unique_ptr<wait_node_supplier<Node>>
make_wait_node_pool(const async_lock_options &options) {
  if (options.concurrency_level == 0)
    return std::make_unique<unbounded_wait_node_pool<Node>>(
        options.run_continuations_asynchronously);
  return std::make_unique<bounded_wait_node_pool<Node>>(
      options.concurrency_level, options.run_continuations_asynchronously);
}

} // namespace tasksync

#endif // TASKSYNC_SYNC_WAIT_NODE_POOL_HPP
