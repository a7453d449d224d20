#include <exception>
#include <utility>

#include <glog/logging.h>

#include "allocator.hpp"
#include "task_scheduler.hpp"

namespace tasksync {

thread_local bool task_scheduler::is_worker_ = false;

task_scheduler::task_scheduler(std::size_t worker_count) {
  init_allocator();

  if (worker_count == 0)
    worker_count = 1;

  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i)
    workers_.emplace_back([this, i] { worker_loop(i); });
}

task_scheduler::~task_scheduler() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutting_down_.store(true, std::memory_order_release);
  }
  work_cv_.notify_all();

  for (auto &thr : workers_) {
    if (thr.joinable())
      thr.join();
  }
}

void task_scheduler::worker_loop(std::size_t worker_id) {
  is_worker_ = true;

  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      work_cv_.wait(lock, [this] {
        return !queue_.empty() ||
               shutting_down_.load(std::memory_order_acquire);
      });
      // Drain what is left before exiting so no continuation is lost
      if (queue_.empty())
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }

    try {
      task();
    } catch (const std::exception &e) {
      LOG(ERROR) << "task_scheduler worker " << worker_id
                 << " caught exception from task: " << e.what();
    }
  }
}

void task_scheduler::schedule_task(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!shutting_down_.load(std::memory_order_acquire)) {
      queue_.push_back(std::move(task));
      task = nullptr;
    }
  }

  if (task) {
    // No workers accept work any more, run inline
    task();
    return;
  }
  work_cv_.notify_one();
}

void task_scheduler::schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;
  schedule_task([handle] { handle.resume(); });
}

std::size_t task_scheduler::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

bool task_scheduler::is_worker_thread() noexcept { return is_worker_; }

task_scheduler &get_task_scheduler() {
  static task_scheduler scheduler;
  return scheduler;
}

} // namespace tasksync
