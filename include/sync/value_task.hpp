#ifndef TASKSYNC_SYNC_VALUE_TASK_HPP
#define TASKSYNC_SYNC_VALUE_TASK_HPP

#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "completion_source.hpp"
#include "crtp_base.hpp"

namespace tasksync {

// =============================================================================
// Value Task - Awaitable handle to one wait on a completion source
// =============================================================================
//
// Either holds an immediate outcome or (source, epoch). Awaiting it attaches
// a continuation to the source; await_resume consumes the result exactly once.
//
// U is the payload type of the source, T the type the task yields. A task
// with T = void discards the payload (lock acquisitions ride bool wait nodes).

template <typename T, typename U>
class value_task : public awaitable_base<value_task<T, U>, T> {
public:
  using source_type = value_completion_source<U>;

  value_task() = default;

  value_task(std::shared_ptr<source_type> source, std::int16_t token)
      : source_(std::move(source)), token_(token) {}

  value_task(value_task &&) noexcept = default;
  value_task &operator=(value_task &&) noexcept = default;
  value_task(const value_task &) = delete;
  value_task &operator=(const value_task &) = delete;

  template <typename... Args> static value_task from_result(Args &&...args) {
    value_task task;
    task.immediate_.set_value(std::forward<Args>(args)...);
    return task;
  }

  static value_task from_exception(std::exception_ptr e) {
    value_task task;
    task.immediate_.set_exception(std::move(e));
    return task;
  }

  bool is_completed() const noexcept {
    return !source_ || source_->is_completed();
  }

  // false: resume wherever the source completes instead of on the awaiting
  // scheduling context
  value_task &&configure_await(bool continue_on_captured_context) && {
    flags_ = continue_on_captured_context
                 ? continuation_flags::use_scheduling_context |
                       continuation_flags::flow_execution_context
                 : continuation_flags::flow_execution_context;
    return std::move(*this);
  }

  // Same wait, yielding nothing. The payload is dropped on consumption.
  value_task<void, U> discard_value() && {
    if (source_)
      return value_task<void, U>(std::move(source_), token_);
    if (immediate_.has_exception())
      return value_task<void, U>::from_exception(immediate_.exception());
    return value_task<void, U>::from_result();
  }

  bool ready_impl() const { return is_completed(); }

  // False when the result arrived after await_ready: the awaiting coroutine
  // continues on this thread instead of being resumed from in here
  bool suspend_impl(std::coroutine_handle<> h) {
    // The coroutine may be resumed (and this task destroyed) before
    // try_attach_continuation returns
    auto source = source_;
    return source->try_attach_continuation(continuation::resume(h, flags_),
                                           token_);
  }

  T resume_impl() { return take(); }

  // Blocks the calling thread until the result is available. Must not be
  // called from the thread the continuation would be posted to.
  T get() {
    if (source_ && !source_->is_completed()) {
      blocking_signal signal;
      auto source = source_;
      source->on_completed(&blocking_signal::notify, &signal, token_,
                           continuation_flags::none);
      std::unique_lock<std::mutex> lock(signal.mutex);
      signal.cv.wait(lock, [&] { return signal.done; });
    }
    return take();
  }

private:
  struct blocking_signal {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};

    static void notify(void *state) {
      auto *self = static_cast<blocking_signal *>(state);
      std::lock_guard<std::mutex> lock(self->mutex);
      self->done = true;
      self->cv.notify_one();
    }
  };

  T take() {
    if (!source_)
      return immediate_.take();

    auto source = std::move(source_);
    if constexpr (std::is_void_v<T>) {
      static_cast<void>(source->get_result(token_));
    } else {
      return static_cast<T>(source->get_result(token_));
    }
  }

  std::shared_ptr<source_type> source_;
  std::int16_t token_{0};
  result_holder<T> immediate_;
  continuation_flags flags_{continuation_flags::use_scheduling_context |
                            continuation_flags::flow_execution_context};
};

template <typename T>
value_task<T> value_completion_source<T>::create_task(
    std::chrono::milliseconds timeout, const cancellation_token &token) {
  auto self = std::static_pointer_cast<value_completion_source<T>>(
      shared_from_this());
  auto version = prepare_wait(timeout, token);
  if (!version)
    throw invalid_operation_error(error_messages::invalid_source_state);
  return value_task<T>(std::move(self), *version);
}

} // namespace tasksync

#endif // TASKSYNC_SYNC_VALUE_TASK_HPP
