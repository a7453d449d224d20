#ifndef TASKSYNC_CANCELLATION_HPP
#define TASKSYNC_CANCELLATION_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tasksync {

// Exception thrown when a cancelled operation is detected
struct cancelled_exception : std::exception {
  const char *what() const noexcept override { return "operation cancelled"; }
};

// Shared state for cancellation, one per cancellation_source
class cancellation_state {
public:
  using callback_id = std::size_t;

  cancellation_state() = default;

  cancellation_state(const cancellation_state &) = delete;
  cancellation_state &operator=(const cancellation_state &) = delete;

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Callbacks run on the cancelling thread, after the registry lock has been
  // released, so a callback may freely unregister itself or others.
  void cancel() {
    std::vector<entry> fired;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_.exchange(true, std::memory_order_acq_rel))
        return; // already cancelled
      fired.swap(callbacks_);
    }
    for (auto &e : fired)
      e.callback();
  }

  // Register a callback invoked on cancellation. Returns an id for removal,
  // or 0 without invoking the callback if cancellation already happened.
  callback_id try_register_callback(std::function<void()> cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_acquire))
      return 0;
    callback_id id = next_id_++;
    callbacks_.push_back(entry{id, std::move(cb)});
    return id;
  }

  // Idempotent: unknown, already fired or zero ids are ignored.
  void unregister_callback(callback_id id) {
    if (id == 0)
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
      if (it->id == id) {
        callbacks_.erase(it);
        return;
      }
    }
  }

  std::size_t callback_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
  }

private:
  struct entry {
    callback_id id;
    std::function<void()> callback;
  };

  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  std::vector<entry> callbacks_;
  callback_id next_id_{1};
};

// Lightweight copyable handle, does not own the state
class cancellation_token {
public:
  cancellation_token() = default;

  bool is_cancelled() const { return state_ && state_->is_cancelled(); }

  // A default token can never be cancelled
  bool can_be_cancelled() const { return state_ != nullptr; }

  void throw_if_cancelled() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  explicit operator bool() const { return state_ != nullptr; }

  // Access to state for timer/completion source integration
  std::shared_ptr<cancellation_state> state() const { return state_; }

  friend bool operator==(const cancellation_token &,
                         const cancellation_token &) = default;

private:
  friend class cancellation_source;
  explicit cancellation_token(std::shared_ptr<cancellation_state> state)
      : state_(std::move(state)) {}

  std::shared_ptr<cancellation_state> state_;
};

// Owns the cancellation state, creates tokens, triggers cancellation
class cancellation_source {
public:
  cancellation_source() : state_(std::make_shared<cancellation_state>()) {}

  cancellation_token token() const { return cancellation_token{state_}; }

  void cancel() { state_->cancel(); }

  bool is_cancelled() const { return state_->is_cancelled(); }

private:
  std::shared_ptr<cancellation_state> state_;
};

} // namespace tasksync

#endif // TASKSYNC_CANCELLATION_HPP
