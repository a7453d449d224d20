#ifndef TASKSYNC_SYNC_CONTINUATION_HPP
#define TASKSYNC_SYNC_CONTINUATION_HPP

#include <coroutine>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "../execution_context.hpp"
#include "../task_scheduler.hpp"

namespace tasksync {

enum class continuation_flags : unsigned {
  none = 0,
  // Resume on the scheduling context current at capture time
  use_scheduling_context = 1u << 0,
  // Restore the captured execution context around the callback
  flow_execution_context = 1u << 1,
};

constexpr continuation_flags operator|(continuation_flags a,
                                       continuation_flags b) noexcept {
  return static_cast<continuation_flags>(static_cast<unsigned>(a) |
                                         static_cast<unsigned>(b));
}

constexpr bool has_flag(continuation_flags value,
                        continuation_flags flag) noexcept {
  return (static_cast<unsigned>(value) & static_cast<unsigned>(flag)) != 0;
}

// =============================================================================
// Continuation - Callback attached by the consumer of a completion source
// =============================================================================
//
// Dispatch policy:
//   captured scheduling context -> post to it
//   run asynchronously          -> task scheduler worker pool
//   otherwise                   -> inline on the completing thread
//
// The captured execution context (if any) is restored around the callback on
// whichever thread ends up running it.

class continuation {
public:
  using action_type = void (*)(void *);

  continuation() = default;

  continuation(action_type action, void *state, continuation_flags flags)
      : action_(action), state_(state) {
    if (has_flag(flags, continuation_flags::use_scheduling_context))
      scheduling_context_ = scheduling_context::current();
    if (has_flag(flags, continuation_flags::flow_execution_context))
      context_ = execution_context::capture();
  }

  // Continuation that resumes a suspended coroutine
  static continuation resume(std::coroutine_handle<> h,
                             continuation_flags flags) {
    return continuation(
        [](void *address) {
          std::coroutine_handle<>::from_address(address).resume();
        },
        h.address(), flags);
  }

  bool valid() const noexcept { return action_ != nullptr; }

  explicit operator bool() const noexcept { return valid(); }

  // Invoked by the thread that completed the source
  void invoke(bool run_asynchronously) const {
    if (scheduling_context_) {
      post_to_scheduling_context();
    } else if (run_asynchronously) {
      queue_on_pool();
    } else if (context_) {
      scoped_execution_context scope(*context_);
      action_(state_);
    } else {
      action_(state_);
    }
  }

  // Invoked by the attaching thread when the result was already available.
  // The caller already runs on its own execution context.
  void invoke_on_current_context(bool run_asynchronously) const {
    if (scheduling_context_)
      post_to_scheduling_context();
    else if (run_asynchronously)
      queue_on_pool();
    else
      action_(state_);
  }

private:
  void post_to_scheduling_context() const {
    auto action = action_;
    auto state = state_;
    auto ctx = context_;
    scheduling_context_->post([action, state, ctx = std::move(ctx)] {
      if (ctx) {
        scoped_execution_context scope(*ctx);
        action(state);
      } else {
        action(state);
      }
    });
  }

  void queue_on_pool() const {
    auto action = action_;
    auto state = state_;
    auto ctx = context_;
    schedule_task_on_pool([action, state, ctx = std::move(ctx)] {
      // Workers start from an empty context; restore the captured one
      scoped_execution_context scope(ctx ? *ctx : execution_context{});
      action(state);
    });
  }

  action_type action_{nullptr};
  void *state_{nullptr};
  std::shared_ptr<scheduling_context> scheduling_context_;
  std::optional<execution_context> context_;
};

} // namespace tasksync

#endif // TASKSYNC_SYNC_CONTINUATION_HPP
