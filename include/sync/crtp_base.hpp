#ifndef TASKSYNC_SYNC_CRTP_BASE_HPP
#define TASKSYNC_SYNC_CRTP_BASE_HPP

#include <atomic>
#include <coroutine>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace tasksync {

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl() const
  // - bool suspend_impl(std::coroutine_handle<> h), false to resume at once
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() const noexcept { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

// Specialization for void
template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() const noexcept { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  void await_resume() { derived().resume_impl(); }
};

// =============================================================================
// Disposable Mixin - Cooperative two-phase disposal
// =============================================================================
//
// request_dispose() marks the object; the owner completes disposal once it is
// quiescent and calls mark_disposed().

template <typename Derived> class disposable_mixin {
protected:
  std::atomic<bool> dispose_requested_{false};
  std::atomic<bool> disposed_{false};

  bool request_dispose() {
    return !dispose_requested_.exchange(true, std::memory_order_acq_rel);
  }

  void mark_disposed() {
    dispose_requested_.store(true, std::memory_order_release);
    disposed_.store(true, std::memory_order_release);
  }

  void throw_if_disposed() const {
    if (disposed_.load(std::memory_order_acquire))
      throw object_disposed_error(Derived::object_name());
  }

  // Rejects new work as soon as disposal was requested
  void throw_if_dispose_requested() const {
    if (dispose_requested_.load(std::memory_order_acquire))
      throw object_disposed_error(Derived::object_name());
  }

public:
  bool is_disposed() const {
    return disposed_.load(std::memory_order_acquire);
  }

  bool is_dispose_requested() const {
    return dispose_requested_.load(std::memory_order_acquire);
  }
};

// =============================================================================
// Result Holder - Type-erased result for async operations
// =============================================================================

template <typename T> class result_holder {
  std::optional<T> value_;
  std::exception_ptr exception_;

public:
  void set_value(T value) { value_ = std::move(value); }

  void set_exception(std::exception_ptr e) { exception_ = std::move(e); }

  bool has_value() const { return value_.has_value(); }

  bool has_exception() const { return exception_ != nullptr; }

  const std::exception_ptr &exception() const { return exception_; }

  // Moves the outcome out and leaves the holder empty
  T take() {
    if (exception_)
      std::rethrow_exception(std::exchange(exception_, nullptr));
    T result = std::move(*value_);
    value_.reset();
    return result;
  }

  const T &peek() const {
    if (exception_)
      std::rethrow_exception(exception_);
    return *value_;
  }

  void clear() {
    value_.reset();
    exception_ = nullptr;
  }
};

template <> class result_holder<void> {
  bool completed_{false};
  std::exception_ptr exception_;

public:
  void set_value() { completed_ = true; }

  void set_exception(std::exception_ptr e) { exception_ = std::move(e); }

  bool has_value() const { return completed_; }

  bool has_exception() const { return exception_ != nullptr; }

  const std::exception_ptr &exception() const { return exception_; }

  void take() {
    completed_ = false;
    if (exception_)
      std::rethrow_exception(std::exchange(exception_, nullptr));
  }

  void clear() {
    completed_ = false;
    exception_ = nullptr;
  }
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_CRTP_BASE_HPP
