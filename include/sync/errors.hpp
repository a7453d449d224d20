#ifndef TASKSYNC_SYNC_ERRORS_HPP
#define TASKSYNC_SYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tasksync {

// Completion token does not match the source, or the source is in a state
// that does not allow the requested operation.
struct invalid_operation_error : std::logic_error {
  using std::logic_error::logic_error;
};

// Release or downgrade attempted by a caller that does not hold the lock.
struct synchronization_lock_error : std::logic_error {
  synchronization_lock_error()
      : std::logic_error("the lock is not held by the caller") {}
};

struct object_disposed_error : std::logic_error {
  explicit object_disposed_error(const std::string &object_name)
      : std::logic_error("cannot access a disposed object: " + object_name) {}
};

struct timeout_error : std::runtime_error {
  timeout_error() : std::runtime_error("the operation has timed out") {}
};

struct pool_exhausted_error : std::runtime_error {
  pool_exhausted_error()
      : std::runtime_error("wait node pool has no free nodes") {}
};

namespace error_messages {
inline constexpr const char *invalid_source_token =
    "completion token does not match the current epoch of the source";
inline constexpr const char *invalid_source_state =
    "completion source is not in a state that allows this operation";
} // namespace error_messages

} // namespace tasksync

#endif // TASKSYNC_SYNC_ERRORS_HPP
