#ifndef TASKSYNC_TIMER_SERVICE_HPP
#define TASKSYNC_TIMER_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace tasksync {

using timer_id = std::uint64_t;

struct timer_entry {
  timer_id id;
  std::function<void()> callback;
};

// One background thread fires expired timers. Callbacks run on that thread
// with the service lock released; they must be short.
class timer_service {
public:
  using clock = std::chrono::steady_clock;

  timer_service();
  ~timer_service();

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  timer_id add_timer(clock::time_point deadline, std::function<void()> callback);

  // Delays past the end of the clock's range saturate to time_point::max(),
  // a timer that never fires on its own.
  template <typename Rep, typename Period>
  timer_id add_timer(std::chrono::duration<Rep, Period> delay,
                     std::function<void()> callback) {
    return add_timer(deadline_after(delay), std::move(callback));
  }

  template <typename Rep, typename Period>
  static clock::time_point
  deadline_after(std::chrono::duration<Rep, Period> delay) {
    const auto now = clock::now();
    // Compared in the caller's unit: converting a huge delay to the clock's
    // nanoseconds would overflow
    const auto headroom = std::chrono::duration_cast<
        std::chrono::duration<Rep, Period>>(clock::time_point::max() - now);
    if (delay >= headroom)
      return clock::time_point::max();
    return now + std::chrono::duration_cast<clock::duration>(delay);
  }

  // Non-blocking: returns false if the timer already fired (or is firing) or
  // was never registered. Does not wait for a running callback. The callback
  // is destroyed before this returns.
  bool cancel_timer(timer_id id);

  std::size_t pending() const;

  // Drops every pending timer without firing it and joins the thread.
  void shutdown();

private:
  using timer_queue = std::multimap<clock::time_point, timer_entry>;

  void run();

  timer_queue timers_;
  std::unordered_map<timer_id, timer_queue::iterator> index_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  timer_id next_id_{1};
  std::thread thread_;
};

timer_service &get_timer_service();

} // namespace tasksync

#endif // TASKSYNC_TIMER_SERVICE_HPP
