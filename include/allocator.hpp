#ifndef TASKSYNC_ALLOCATOR_HPP
#define TASKSYNC_ALLOCATOR_HPP

#include <mimalloc.h>

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <utility>

namespace tasksync {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void *do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void *p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource &other) const noexcept override;
};

// Install mimalloc as the global default PMR resource. Idempotent; called
// from the task_scheduler constructor before any worker starts.
void init_allocator();

// Global mimalloc-backed PMR resource (singleton)
std::pmr::memory_resource *mi_resource() noexcept;

// Bytes handed out by mi_resource() and not yet returned
std::size_t mi_resource_bytes_in_use() noexcept;

// Shared object whose control block and payload live in one mimalloc block.
// Used for long-lived bookkeeping objects such as wait nodes.
template <typename T, typename... Args>
std::shared_ptr<T> allocate_shared_node(Args &&...args) {
  return std::allocate_shared<T>(
      std::pmr::polymorphic_allocator<T>(mi_resource()),
      std::forward<Args>(args)...);
}

} // namespace tasksync

#endif // TASKSYNC_ALLOCATOR_HPP
