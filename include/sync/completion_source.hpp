#ifndef TASKSYNC_SYNC_COMPLETION_SOURCE_HPP
#define TASKSYNC_SYNC_COMPLETION_SOURCE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../cancellation.hpp"
#include "../timer_service.hpp"
#include "concepts.hpp"
#include "continuation.hpp"
#include "crtp_base.hpp"
#include "errors.hpp"

namespace tasksync {

inline constexpr std::chrono::milliseconds infinite_timeout{-1};

// Throws std::invalid_argument for negative timeouts other than infinite
inline void validate_timeout(std::chrono::milliseconds timeout) {
  if (timeout < std::chrono::milliseconds::zero() && timeout != infinite_timeout)
    throw std::invalid_argument("timeout must be non-negative or infinite");
}

enum class completion_source_status : std::uint8_t {
  wait_for_activation = 0,
  activated = 1,
  wait_for_consumption = 2,
  consumed = 3,
};

// =============================================================================
// Version And Status - Packed (epoch, status) word
// =============================================================================
//
// Layout of the 64-bit word:
//   bits  0..15  epoch (int16, two's complement)
//   bits 32..39  status
//
// Both halves change together through compare-and-swap only, so a consumer
// validates "this result belongs to the wait I started" in one step.

class version_and_status {
public:
  struct snapshot {
    std::int16_t version;
    completion_source_status status;
  };

  explicit version_and_status(std::int16_t initial_version) noexcept
      : value_(combine(initial_version,
                       completion_source_status::wait_for_activation)) {}

  static constexpr std::uint64_t combine(std::int16_t version,
                                         completion_source_status status) noexcept {
    return static_cast<std::uint64_t>(static_cast<std::uint16_t>(version)) |
           (static_cast<std::uint64_t>(status) << status_shift);
  }

  static constexpr std::int16_t version_of(std::uint64_t word) noexcept {
    return static_cast<std::int16_t>(
        static_cast<std::uint16_t>(word & version_mask));
  }

  static constexpr completion_source_status status_of(std::uint64_t word) noexcept {
    return static_cast<completion_source_status>((word >> status_shift) &
                                                 status_mask);
  }

  snapshot load() const noexcept {
    auto word = value_.load(std::memory_order_acquire);
    return {version_of(word), status_of(word)};
  }

  std::int16_t version() const noexcept { return load().version; }

  completion_source_status status() const noexcept { return load().status; }

  bool is_completed() const noexcept {
    return status() >= completion_source_status::wait_for_consumption;
  }

  // (version, from) -> (version, to). False if the word is different.
  bool transition(std::int16_t version, completion_source_status from,
                  completion_source_status to) noexcept {
    auto expected = combine(version, from);
    return value_.compare_exchange_strong(expected, combine(version, to),
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire);
  }

  // (version, wait_for_consumption) -> (version, consumed) or throw
  void consume(std::int16_t version) {
    auto expected = combine(version, completion_source_status::wait_for_consumption);
    if (value_.compare_exchange_strong(
            expected, combine(version, completion_source_status::consumed),
            std::memory_order_acq_rel, std::memory_order_acquire))
      return;

    if (status_of(expected) != completion_source_status::wait_for_consumption)
      throw invalid_operation_error(error_messages::invalid_source_state);
    throw invalid_operation_error(error_messages::invalid_source_token);
  }

  // Bumps the epoch (wrapping) and returns to wait_for_activation
  std::int16_t reset() noexcept {
    auto current = value_.load(std::memory_order_acquire);
    std::uint64_t next;
    do {
      next = combine(static_cast<std::int16_t>(version_of(current) + 1),
                     completion_source_status::wait_for_activation);
    } while (!value_.compare_exchange_weak(current, next,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire));
    return version_of(next);
  }

private:
  static constexpr unsigned status_shift = 32;
  static constexpr std::uint64_t version_mask = 0xFFFFu;
  static constexpr std::uint64_t status_mask = 0xFFu;

  std::atomic<std::uint64_t> value_;
};

// =============================================================================
// Wait Racer - Cancellation and timeout subscriptions of one armed wait
// =============================================================================

class wait_racer {
public:
  wait_racer() = default;

  wait_racer(wait_racer &&other) noexcept
      : token_state_(std::move(other.token_state_)),
        token_callback_(std::exchange(other.token_callback_, 0)),
        timer_(std::exchange(other.timer_, 0)) {}

  wait_racer &operator=(wait_racer &&other) noexcept {
    if (this != &other) {
      token_state_ = std::move(other.token_state_);
      token_callback_ = std::exchange(other.token_callback_, 0);
      timer_ = std::exchange(other.timer_, 0);
    }
    return *this;
  }

  wait_racer(const wait_racer &) = delete;
  wait_racer &operator=(const wait_racer &) = delete;

  void track_token(std::shared_ptr<cancellation_state> state,
                   cancellation_state::callback_id id) {
    token_state_ = std::move(state);
    token_callback_ = id;
  }

  void track_timer(timer_id id) noexcept { timer_ = id; }

  bool armed() const noexcept { return token_callback_ != 0 || timer_ != 0; }

  // Unsubscribes both signals. Never blocks on a callback in flight; such a
  // callback is rejected by the epoch check of the source.
  void cleanup() {
    if (token_state_) {
      token_state_->unregister_callback(std::exchange(token_callback_, 0));
      token_state_.reset();
    }
    if (timer_ != 0)
      get_timer_service().cancel_timer(std::exchange(timer_, 0));
  }

private:
  std::shared_ptr<cancellation_state> token_state_;
  cancellation_state::callback_id token_callback_{0};
  timer_id timer_{0};
};

// =============================================================================
// Resumption - Work left over by a completion, run outside every lock
// =============================================================================

class resumption {
public:
  resumption() = default;

  resumption(wait_racer racer, continuation cont, bool run_asynchronously)
      : racer_(std::move(racer)), continuation_(std::move(cont)),
        run_asynchronously_(run_asynchronously) {}

  resumption(resumption &&) noexcept = default;
  resumption &operator=(resumption &&) noexcept = default;

  bool has_continuation() const noexcept { return continuation_.valid(); }

  void run() {
    racer_.cleanup();
    if (continuation_) {
      auto c = std::exchange(continuation_, continuation{});
      c.invoke(run_asynchronously_);
    }
  }

private:
  wait_racer racer_;
  continuation continuation_;
  bool run_asynchronously_{false};
};

// Awaitable over a completion source with payload U, yielding T (value_task.hpp)
template <typename T, typename U = T> class value_task;

// =============================================================================
// Manual Reset Completion Source
// =============================================================================
//
// One pending asynchronous result that can be recycled. Lifecycle:
//
//   wait_for_activation --prepare_wait--> activated --complete-->
//   wait_for_consumption --consume--> consumed --reset--> wait_for_activation
//
// Sources armed with a timeout or a cancellable token must be owned by a
// std::shared_ptr: the racer callbacks only hold a weak reference.

class manual_reset_completion_source
    : public std::enable_shared_from_this<manual_reset_completion_source> {
public:
  static constexpr std::int16_t initial_completion_token =
      std::numeric_limits<std::int16_t>::min();

  virtual ~manual_reset_completion_source() = default;

  manual_reset_completion_source(const manual_reset_completion_source &) = delete;
  manual_reset_completion_source &
  operator=(const manual_reset_completion_source &) = delete;

  completion_source_status status() const noexcept { return state_.status(); }

  std::int16_t version() const noexcept { return state_.version(); }

  bool is_completed() const noexcept { return state_.is_completed(); }

  bool run_continuations_asynchronously() const noexcept {
    return run_continuations_asynchronously_;
  }

  // Arms an idle source. Returns the epoch the consumer must present later,
  // or std::nullopt if the source is busy with another wait.
  std::optional<std::int16_t> prepare_wait(std::chrono::milliseconds timeout,
                                           const cancellation_token &token = {}) {
    validate_timeout(timeout);
    if (needs_racer(timeout, token) && weak_from_this().expired())
      throw invalid_operation_error(
          "completion source armed with a timeout or token must be owned by "
          "std::shared_ptr");

    std::optional<std::int16_t> result;
    std::optional<resumption> immediate;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto current = state_.load();
      switch (current.status) {
      case completion_source_status::wait_for_activation:
        state_.transition(current.version, current.status,
                          completion_source_status::activated);
        immediate = activate(timeout, token);
        result = current.version;
        break;
      case completion_source_status::wait_for_consumption:
        // Result already there, not yet consumed
        result = current.version;
        break;
      default:
        break;
      }
    }

    if (immediate)
      immediate->run();
    return result;
  }

  void attach_continuation(continuation c, std::int16_t token) {
    // Completed already: no need to suspend
    if (!try_attach_continuation(std::move(c), token))
      c.invoke_on_current_context(run_continuations_asynchronously_);
  }

  // Stores `c` for the pending wait. Returns false, leaving `c` untouched and
  // not invoked, if the result is already available.
  bool try_attach_continuation(continuation &&c, std::int16_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = state_.load();
    if (current.version != token)
      throw invalid_operation_error(error_messages::invalid_source_token);

    switch (current.status) {
    case completion_source_status::activated:
      if (continuation_)
        throw invalid_operation_error("continuation is already attached");
      continuation_ = std::move(c);
      return true;
    case completion_source_status::wait_for_consumption:
      return false;
    default:
      throw invalid_operation_error(error_messages::invalid_source_state);
    }
  }

  void on_completed(continuation::action_type action, void *state,
                    std::int16_t token, continuation_flags flags) {
    attach_continuation(continuation(action, state, flags), token);
  }

  bool try_set_exception(std::exception_ptr e) {
    return fire(try_complete_deferred([&] { store_exception(std::move(e)); }));
  }

  std::optional<resumption> try_set_exception_deferred(std::exception_ptr e) {
    return try_complete_deferred([&] { store_exception(std::move(e)); });
  }

  bool try_set_canceled() {
    return fire(try_complete_deferred([this] { store_cancellation_outcome(); }));
  }

  // Recycles a completed source. Any callback armed for the previous epoch
  // is a no-op from here on.
  std::int16_t reset() {
    wait_racer leftover;
    std::int16_t token;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!state_.is_completed())
        throw invalid_operation_error(error_messages::invalid_source_state);
      token = reset_locked(leftover);
    }
    leftover.cleanup();
    cleanup();
    return token;
  }

  // Same as reset() but gives up instead of waiting for the source lock or
  // throwing on a source that is still in use.
  std::optional<std::int16_t> try_reset() {
    wait_racer leftover;
    std::int16_t token;
    {
      std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
      if (!lock.owns_lock() || !state_.is_completed())
        return std::nullopt;
      token = reset_locked(leftover);
    }
    leftover.cleanup();
    cleanup();
    return token;
  }

protected:
  explicit manual_reset_completion_source(bool run_continuations_asynchronously)
      : run_continuations_asynchronously_(run_continuations_asynchronously) {}

  // Payload hooks; called with the source lock held and status == activated
  virtual void store_timeout_outcome() = 0;
  virtual void store_cancellation_outcome() = 0;
  virtual void store_exception(std::exception_ptr e) = 0;

  // Called with the source lock held during reset
  virtual void clear_payload() = 0;

  // Called after reset, outside the lock
  virtual void cleanup() {}

  // Called by the consumer once the result has been taken
  virtual void after_consumed() {}

  // Runs `store` and moves activated -> wait_for_consumption under the lock.
  // The returned resumption must be run by the caller once it holds no lock.
  template <typename Store>
  std::optional<resumption> try_complete_deferred(Store &&store) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status() != completion_source_status::activated)
      return std::nullopt;
    std::forward<Store>(store)();
    return complete_locked();
  }

  void consume(std::int16_t token) { state_.consume(token); }

  static bool fire(std::optional<resumption> r) {
    if (!r)
      return false;
    r->run();
    return true;
  }

private:
  static bool needs_racer(std::chrono::milliseconds timeout,
                          const cancellation_token &token) noexcept {
    if (timeout == std::chrono::milliseconds::zero() || token.is_cancelled())
      return false;
    return timeout != infinite_timeout || token.can_be_cancelled();
  }

  std::optional<resumption> activate(std::chrono::milliseconds timeout,
                                     const cancellation_token &token) {
    if (timeout == std::chrono::milliseconds::zero()) {
      store_timeout_outcome();
      return complete_locked();
    }
    if (token.is_cancelled()) {
      store_cancellation_outcome();
      return complete_locked();
    }

    if (!needs_racer(timeout, token))
      return std::nullopt;

    std::weak_ptr<manual_reset_completion_source> weak = weak_from_this();
    const auto version = state_.version();

    if (token.can_be_cancelled()) {
      auto token_state = token.state();
      auto id = token_state->try_register_callback([weak, version] {
        if (auto self = weak.lock())
          self->cancellation_requested(version, false);
      });
      if (id == 0) {
        // Cancelled between the check above and the registration
        store_cancellation_outcome();
        return complete_locked();
      }
      racer_.track_token(std::move(token_state), id);
    }

    if (timeout != infinite_timeout) {
      racer_.track_timer(get_timer_service().add_timer(timeout, [weak, version] {
        if (auto self = weak.lock())
          self->cancellation_requested(version, true);
      }));
    }
    return std::nullopt;
  }

  // Shared by the token and the timer callback. May run after reset() or
  // twice for the same wait; both cases are filtered out here.
  void cancellation_requested(std::int16_t expected_version, bool timed_out) {
    std::optional<resumption> r;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto current = state_.load();
      if (current.status != completion_source_status::activated ||
          current.version != expected_version)
        return;

      if (timed_out)
        store_timeout_outcome();
      else
        store_cancellation_outcome();
      r = complete_locked();
    }
    r->run();
  }

  resumption complete_locked() {
    state_.transition(state_.version(), completion_source_status::activated,
                      completion_source_status::wait_for_consumption);
    return resumption(std::move(racer_),
                      std::exchange(continuation_, continuation{}),
                      run_continuations_asynchronously_);
  }

  std::int16_t reset_locked(wait_racer &leftover) {
    auto token = state_.reset();
    clear_payload();
    continuation_ = continuation{};
    leftover = std::move(racer_);
    return token;
  }

  mutable std::mutex mutex_;
  version_and_status state_{initial_completion_token};
  continuation continuation_;
  wait_racer racer_;
  const bool run_continuations_asynchronously_;
};

// =============================================================================
// Value Completion Source - Completion source with a typed payload
// =============================================================================

template <typename T>
class value_completion_source : public manual_reset_completion_source {
public:
  explicit value_completion_source(bool run_continuations_asynchronously = false)
      : manual_reset_completion_source(run_continuations_asynchronously) {}

  template <typename... Args> bool try_set_result(Args &&...args) {
    return fire(try_set_result_deferred(std::forward<Args>(args)...));
  }

  template <typename... Args>
  std::optional<resumption> try_set_result_deferred(Args &&...args) {
    return try_complete_deferred(
        [&] { result_.set_value(std::forward<Args>(args)...); });
  }

  // As try_set_result_deferred, but runs `commit` once the source is known
  // to accept the result and before the result becomes visible to the
  // consumer. Used to publish the state a grant stands for.
  template <typename Commit, typename... Args>
  std::optional<resumption> try_commit_result_deferred(Commit &&commit,
                                                       Args &&...args) {
    return try_complete_deferred([&] {
      std::forward<Commit>(commit)();
      result_.set_value(std::forward<Args>(args)...);
    });
  }

  // Consumes the result of the wait identified by `token`. Throws
  // invalid_operation_error for a stale token or a source that is not done.
  T get_result(std::int16_t token) {
    consume(token);
    result_holder<T> outcome = std::move(result_);
    result_.clear();
    after_consumed();
    return outcome.take();
  }

  // Arms the source and wraps it into an awaitable (see value_task.hpp)
  value_task<T> create_task(std::chrono::milliseconds timeout,
                               const cancellation_token &token = {});

protected:
  void store_timeout_outcome() override {
    result_.set_exception(std::make_exception_ptr(timeout_error{}));
  }

  void store_cancellation_outcome() override {
    result_.set_exception(std::make_exception_ptr(cancelled_exception{}));
  }

  void store_exception(std::exception_ptr e) override {
    result_.set_exception(std::move(e));
  }

  void clear_payload() override { result_.clear(); }

  result_holder<T> &payload() noexcept { return result_; }

private:
  result_holder<T> result_;
};

static_assert(ResettableCompletionSource<value_completion_source<int>>);

} // namespace tasksync

#endif // TASKSYNC_SYNC_COMPLETION_SOURCE_HPP
