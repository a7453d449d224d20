#ifndef TASKSYNC_SYNC_CONCEPTS_HPP
#define TASKSYNC_SYNC_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <cstdint>
#include <type_traits>

namespace tasksync {

// =============================================================================
// Coroutine Awaiter Concept
// =============================================================================

template <typename T>
concept Awaiter = requires(T a, std::coroutine_handle<> h) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_suspend(h) };
  { a.await_resume() };
};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// Guard of the mutual-exclusion region of a queued primitive
template <typename P>
concept GuardPolicy = Lockable<typename P::mutex_type> &&
                      std::constructible_from<typename P::lock_type,
                                              typename P::mutex_type &>;

// =============================================================================
// Completion Source Concepts
// =============================================================================

// Producer side of a resettable completion source
template <typename S>
concept ResettableCompletionSource = requires(S s, std::int16_t token) {
  { s.is_completed() } -> std::convertible_to<bool>;
  { s.version() } -> std::same_as<std::int16_t>;
  { s.reset() } -> std::same_as<std::int16_t>;
  { s.try_set_canceled() } -> std::convertible_to<bool>;
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_CONCEPTS_HPP
