#ifndef TASKSYNC_EXECUTION_CONTEXT_HPP
#define TASKSYNC_EXECUTION_CONTEXT_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tasksync {

// =============================================================================
// Execution Context - Ambient values that flow with a logical caller
// =============================================================================
//
// Each thread has a current context: an immutable snapshot of ambient values.
// set_value() replaces the snapshot (copy-on-write), so a captured context is
// never affected by later changes on the capturing thread.

class execution_context {
public:
  execution_context() = default;

  // Snapshot of the calling thread's current context
  static execution_context capture();

  // Make ctx the calling thread's current context
  static void restore(const execution_context &ctx);

  static void set_value(const std::string &key, std::string value);
  static std::optional<std::string> get_value(const std::string &key);
  static void clear();

  bool empty() const noexcept { return !values_ || values_->empty(); }

  friend bool operator==(const execution_context &a,
                         const execution_context &b) noexcept {
    return a.values_ == b.values_;
  }

private:
  using value_map = std::map<std::string, std::string>;

  explicit execution_context(std::shared_ptr<const value_map> values)
      : values_(std::move(values)) {}

  std::shared_ptr<const value_map> values_;
};

// Restores `ctx` for the lifetime of the guard, then puts back whatever was
// current before.
class scoped_execution_context {
public:
  explicit scoped_execution_context(const execution_context &ctx)
      : saved_(execution_context::capture()) {
    execution_context::restore(ctx);
  }

  ~scoped_execution_context() { execution_context::restore(saved_); }

  scoped_execution_context(const scoped_execution_context &) = delete;
  scoped_execution_context &operator=(const scoped_execution_context &) = delete;

private:
  execution_context saved_;
};

// =============================================================================
// Scheduling Context - Execution substrate affinity (UI loop, strand, ...)
// =============================================================================

class scheduling_context {
public:
  virtual ~scheduling_context() = default;

  // Queue work to run on this context. Must not run it inline.
  virtual void post(std::function<void()> work) = 0;

  // Context installed on the calling thread, or nullptr
  static std::shared_ptr<scheduling_context> current();

  static void set_current(std::shared_ptr<scheduling_context> ctx);
};

class scoped_scheduling_context {
public:
  explicit scoped_scheduling_context(std::shared_ptr<scheduling_context> ctx)
      : saved_(scheduling_context::current()) {
    scheduling_context::set_current(std::move(ctx));
  }

  ~scoped_scheduling_context() {
    scheduling_context::set_current(std::move(saved_));
  }

  scoped_scheduling_context(const scoped_scheduling_context &) = delete;
  scoped_scheduling_context &
  operator=(const scoped_scheduling_context &) = delete;

private:
  std::shared_ptr<scheduling_context> saved_;
};

} // namespace tasksync

#endif // TASKSYNC_EXECUTION_CONTEXT_HPP
