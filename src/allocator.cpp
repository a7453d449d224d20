#include "allocator.hpp"

#include <atomic>
#include <new>

namespace tasksync {

namespace {

std::atomic<std::size_t> g_bytes_in_use{0};

} // namespace

// --- mi_memory_resource ---

void *mi_memory_resource::do_allocate(std::size_t bytes, std::size_t alignment) {
  void *p = mi_malloc_aligned(bytes, alignment);
  if (!p)
    throw std::bad_alloc();
  g_bytes_in_use.fetch_add(bytes, std::memory_order_relaxed);
  return p;
}

void mi_memory_resource::do_deallocate(void *p, std::size_t bytes,
                                       std::size_t alignment) {
  g_bytes_in_use.fetch_sub(bytes, std::memory_order_relaxed);
  mi_free_aligned(p, alignment);
}

bool mi_memory_resource::do_is_equal(
    const std::pmr::memory_resource &other) const noexcept {
  return this == &other;
}

// --- Singleton resource ---

static mi_memory_resource g_mi_resource;

std::pmr::memory_resource *mi_resource() noexcept { return &g_mi_resource; }

std::size_t mi_resource_bytes_in_use() noexcept {
  return g_bytes_in_use.load(std::memory_order_relaxed);
}

// --- init_allocator ---

static std::atomic<bool> g_allocator_initialized{false};

void init_allocator() {
  bool expected = false;
  if (g_allocator_initialized.compare_exchange_strong(expected, true)) {
    std::pmr::set_default_resource(&g_mi_resource);
  }
}

} // namespace tasksync
