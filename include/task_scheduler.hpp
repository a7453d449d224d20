#ifndef TASKSYNC_TASK_SCHEDULER_HPP
#define TASKSYNC_TASK_SCHEDULER_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tasksync {

/*
  General-purpose worker pool. Primitives never block a worker while waiting;
  the pool only runs continuations that were asked to resume asynchronously
  and coroutine handles handed over by coro_task.
*/
class task_scheduler {
public:
  explicit task_scheduler(
      std::size_t worker_count = std::thread::hardware_concurrency());
  ~task_scheduler();

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;

  // Schedule a task on the worker pool. Runs inline if the pool has no
  // workers or is shutting down.
  void schedule_task(std::function<void()> task);

  // Schedule a coroutine handle on a worker
  void schedule_coro_handle(std::coroutine_handle<> handle);

  std::size_t worker_count() const noexcept { return workers_.size(); }

  // Number of tasks queued but not yet picked up by a worker
  std::size_t pending() const;

  // True when called from one of this process' scheduler workers
  static bool is_worker_thread() noexcept;

private:
  void worker_loop(std::size_t worker_id);

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable work_cv_;
  std::atomic<bool> shutting_down_{false};

  static thread_local bool is_worker_;
};

task_scheduler &get_task_scheduler();

inline void schedule_coro_handle(std::coroutine_handle<> handle) {
  get_task_scheduler().schedule_coro_handle(handle);
}

inline void schedule_task_on_pool(std::function<void()> task) {
  get_task_scheduler().schedule_task(std::move(task));
}

} // namespace tasksync

#endif // TASKSYNC_TASK_SCHEDULER_HPP
