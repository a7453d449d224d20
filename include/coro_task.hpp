#ifndef TASKSYNC_CORO_TASK_HPP
#define TASKSYNC_CORO_TASK_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

#include "sync/crtp_base.hpp"
#include "task_scheduler.hpp"

namespace tasksync {

namespace detail {

// Rendezvous between the task finishing and one coroutine awaiting it.
// Word: 0 nobody waiting, 1 finished, otherwise the awaiting handle.
class continuation_slot {
public:
  // False if the task already finished; the caller resumes itself then
  bool try_park(std::coroutine_handle<> awaiting) noexcept {
    auto expected = empty;
    return word_.compare_exchange_strong(
        expected, reinterpret_cast<std::uintptr_t>(awaiting.address()),
        std::memory_order_acq_rel, std::memory_order_acquire);
  }

  // Marks the task finished and hands back the parked coroutine, if any
  std::coroutine_handle<> finish() noexcept {
    auto previous = word_.exchange(finished, std::memory_order_acq_rel);
    if (previous == empty || previous == finished)
      return std::noop_coroutine();
    return std::coroutine_handle<>::from_address(
        reinterpret_cast<void *>(previous));
  }

private:
  static constexpr std::uintptr_t empty = 0;
  static constexpr std::uintptr_t finished = 1;

  std::atomic<std::uintptr_t> word_{empty};
};

} // namespace detail

// Shared state for coroutine result communication
template <typename T> struct coro_shared_state {
  result_holder<T> result;
  detail::continuation_slot slot;
  std::mutex mutex;
  std::condition_variable cv;
  bool ready{false};

  // Publishes the result. Returns the coroutine to transfer to.
  std::coroutine_handle<> finish() noexcept {
    {
      std::lock_guard<std::mutex> lock(mutex);
      ready = true;
      cv.notify_all();
    }
    return slot.finish();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return ready; });
  }

  bool is_ready() {
    std::lock_guard<std::mutex> lock(mutex);
    return ready;
  }
};

template <typename T> class coro_task;

namespace detail {

template <typename T> struct coro_promise_base {
  std::shared_ptr<coro_shared_state<T>> state =
      std::make_shared<coro_shared_state<T>>();

  std::suspend_always initial_suspend() noexcept { return {}; }

  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      // The frame may be destroyed as soon as the result is published;
      // only the shared state is touched from here on
      auto shared = h.promise().state;
      return shared->finish();
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() { state->result.set_exception(std::current_exception()); }
};

template <typename T> struct coro_promise : coro_promise_base<T> {
  coro_task<T> get_return_object();

  void return_value(T value) { this->state->result.set_value(std::move(value)); }
};

template <> struct coro_promise<void> : coro_promise_base<void> {
  coro_task<void> get_return_object();

  void return_void() { this->state->result.set_value(); }
};

} // namespace detail

// =============================================================================
// Coro Task - Lazily started coroutine run on the task scheduler
// =============================================================================
//
// Nothing runs until start(), get() or co_await. co_await parks the awaiting
// coroutine and resumes it by symmetric transfer when the task finishes.
// The destructor waits for a started task to finish.

template <typename T = void> class coro_task {
public:
  using promise_type = detail::coro_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load()) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      release();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load());
    }
    return *this;
  }

  ~coro_task() { release(); }

  bool await_ready() const noexcept { return false; }

  bool await_suspend(std::coroutine_handle<> awaiting) {
    if (!state_->slot.try_park(awaiting))
      return false; // finished already
    start();
    return true;
  }

  T await_resume() { return state_->result.take(); }

  // Blocking get for non-coroutine contexts
  T get() {
    start();
    state_->wait();
    return state_->result.take();
  }

  bool is_ready() const { return state_ && state_->is_ready(); }

  bool is_started() const { return started_.load(); }

  // Schedules the coroutine on a worker. Idempotent.
  void start() {
    bool expected = false;
    if (started_.compare_exchange_strong(expected, true) && handle_)
      schedule_coro_handle(handle_);
  }

private:
  friend struct detail::coro_promise<T>;

  explicit coro_task(handle_type h)
      : handle_(h), state_(h.promise().state), started_(false) {}

  void release() {
    if (!handle_)
      return;
    if (started_.load())
      state_->wait();
    std::exchange(handle_, nullptr).destroy();
  }

  handle_type handle_;
  std::shared_ptr<coro_shared_state<T>> state_;
  std::atomic<bool> started_;
};

namespace detail {

template <typename T> coro_task<T> coro_promise<T>::get_return_object() {
  return coro_task<T>{coro_task<T>::handle_type::from_promise(*this)};
}

inline coro_task<void> coro_promise<void>::get_return_object() {
  return coro_task<void>{coro_task<void>::handle_type::from_promise(*this)};
}

} // namespace detail

} // namespace tasksync

#endif // TASKSYNC_CORO_TASK_HPP
