#include "timer_service.hpp"

#include <exception>

#include <glog/logging.h>

namespace tasksync {

timer_service::timer_service() : thread_([this] { run(); }) {}

timer_service::~timer_service() { shutdown(); }

timer_id timer_service::add_timer(clock::time_point deadline,
                                  std::function<void()> callback) {
  timer_id id;
  bool earliest;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    // Equal deadlines keep insertion order
    auto it = timers_.emplace(deadline, timer_entry{id, std::move(callback)});
    index_.emplace(id, it);
    earliest = it == timers_.begin();
  }
  if (earliest)
    cv_.notify_one();
  return id;
}

bool timer_service::cancel_timer(timer_id id) {
  // Destroyed after the lock is released: the callback may own the last
  // reference to an object whose destructor cancels timers
  timer_entry removed{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = index_.find(id);
    if (found == index_.end())
      return false;
    removed = std::move(found->second->second);
    timers_.erase(found->second);
    index_.erase(found);
  }
  return true;
}

std::size_t timer_service::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

void timer_service::shutdown() {
  {
    // Flipped under the lock so run() cannot miss the wakeup
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return; // already shut down
  }

  cv_.notify_one();
  if (thread_.joinable())
    thread_.join();

  timer_queue dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!timers_.empty())
      VLOG(1) << "timer_service shutdown dropped " << timers_.size()
              << " pending timers";
    dropped.swap(timers_);
    index_.clear();
  }
}

void timer_service::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_.load(std::memory_order_acquire)) {
    if (timers_.empty()) {
      cv_.wait(lock, [this] {
        return !timers_.empty() || !running_.load(std::memory_order_acquire);
      });
      continue;
    }

    auto earliest = timers_.begin();
    const auto deadline = earliest->first;

    if (deadline == clock::time_point::max()) {
      // Saturated deadline: only a cancel, a new timer or shutdown wakes us
      cv_.wait(lock);
    } else if (deadline <= clock::now()) {
      auto entry = std::move(earliest->second);
      index_.erase(entry.id);
      timers_.erase(earliest);

      lock.unlock();
      try {
        entry.callback();
      } catch (const std::exception &e) {
        LOG(ERROR) << "timer " << entry.id << " callback threw: " << e.what();
      }
      entry.callback = nullptr;
      lock.lock();
    } else {
      cv_.wait_until(lock, deadline);
    }
  }
}

timer_service &get_timer_service() {
  static timer_service service;
  return service;
}

} // namespace tasksync
