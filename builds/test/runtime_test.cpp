#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <glog/logging.h>

#include "tasksync.hpp"

using namespace tasksync;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

template <typename Predicate> bool eventually(Predicate &&predicate) {
  for (int i = 0; i < 400; ++i) {
    if (predicate())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

// =============================================================================
// Task Scheduler Tests
// =============================================================================

void test_task_scheduler() {
  TEST("scheduled tasks all run") {
    task_scheduler scheduler(4);
    assert(scheduler.worker_count() == 4);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i)
      scheduler.schedule_task([&counter] { counter.fetch_add(1); });

    assert(eventually([&] { return counter.load() == 100; }));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("worker thread detection") {
    assert(!task_scheduler::is_worker_thread());

    std::atomic<int> seen{-1};
    schedule_task_on_pool(
        [&seen] { seen.store(task_scheduler::is_worker_thread() ? 1 : 0); });
    assert(eventually([&] { return seen.load() != -1; }));
    assert(seen.load() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("throwing task does not stop the worker") {
    task_scheduler scheduler(1);
    std::atomic<bool> ran{false};
    scheduler.schedule_task([] { throw std::runtime_error("task failure"); });
    scheduler.schedule_task([&ran] { ran.store(true); });

    assert(eventually([&] { return ran.load(); }));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("destructor drains queued work") {
    std::atomic<int> counter{0};
    {
      task_scheduler scheduler(1);
      for (int i = 0; i < 20; ++i)
        scheduler.schedule_task([&counter] {
          std::this_thread::sleep_for(1ms);
          counter.fetch_add(1);
        });
    }
    assert(counter.load() == 20);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Timer Service Tests
// =============================================================================

void test_timer_service() {
  TEST("timer fires after its delay") {
    timer_service timers;
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point when;

    timers.add_timer(20ms, [&] {
      when = std::chrono::steady_clock::now();
      fired.store(true);
    });
    assert(eventually([&] { return fired.load(); }));
    assert(when - start >= 20ms);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("timers fire in deadline order") {
    timer_service timers;
    std::vector<int> order;
    std::mutex mutex;
    auto record = [&](int n) {
      return [&, n] {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(n);
      };
    };

    timers.add_timer(40ms, record(3));
    timers.add_timer(10ms, record(1));
    timers.add_timer(25ms, record(2));

    assert(eventually([&] {
      std::lock_guard<std::mutex> lock(mutex);
      return order.size() == 3;
    }));
    assert((order == std::vector<int>{1, 2, 3}));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancelled timer never fires") {
    timer_service timers;
    std::atomic<bool> fired{false};

    auto id = timers.add_timer(20ms, [&] { fired.store(true); });
    assert(timers.pending() == 1);
    assert(timers.cancel_timer(id));
    assert(!timers.cancel_timer(id));
    assert(timers.pending() == 0);

    std::this_thread::sleep_for(50ms);
    assert(!fired.load());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancel releases the timer at once") {
    timer_service timers;
    auto owned = std::make_shared<int>(7);

    std::vector<timer_id> ids;
    for (int i = 0; i < 1000; ++i)
      ids.push_back(timers.add_timer(1h, [owned] {}));
    assert(timers.pending() == 1000);
    assert(owned.use_count() == 1001);

    bool all_cancelled = true;
    for (auto id : ids)
      all_cancelled = timers.cancel_timer(id) && all_cancelled;
    assert(all_cancelled);
    assert(timers.pending() == 0);
    assert(owned.use_count() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("oversized delays saturate") {
    using clock = timer_service::clock;
    assert(timer_service::deadline_after(std::chrono::milliseconds::max()) ==
           clock::time_point::max());
    assert(timer_service::deadline_after(std::chrono::hours::max()) ==
           clock::time_point::max());

    auto before = clock::now();
    auto near = timer_service::deadline_after(10ms);
    assert(near >= before + 10ms);
    assert(near < clock::time_point::max());

    timer_service timers;
    std::atomic<bool> far_fired{false};
    std::atomic<bool> near_fired{false};
    auto far = timers.add_timer(std::chrono::milliseconds::max(),
                                [&] { far_fired.store(true); });
    timers.add_timer(10ms, [&] { near_fired.store(true); });

    assert(eventually([&] { return near_fired.load(); }));
    std::this_thread::sleep_for(20ms);
    assert(!far_fired.load());
    assert(timers.pending() == 1);
    assert(timers.cancel_timer(far));
    assert(timers.pending() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancel after firing returns false") {
    timer_service timers;
    std::atomic<bool> fired{false};

    auto id = timers.add_timer(5ms, [&] { fired.store(true); });
    assert(eventually([&] { return fired.load(); }));
    assert(!timers.cancel_timer(id));
    assert(!timers.cancel_timer(12345));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("shutdown drops pending timers") {
    timer_service timers;
    std::atomic<bool> fired{false};
    timers.add_timer(1s, [&] { fired.store(true); });
    timers.shutdown();
    assert(timers.pending() == 0);
    assert(!fired.load());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Cancellation Tests
// =============================================================================

void test_cancellation() {
  TEST("callbacks run once on cancel") {
    cancellation_source cts;
    auto token = cts.token();
    assert(token.can_be_cancelled());
    assert(!token.is_cancelled());

    std::atomic<int> calls{0};
    auto id = token.state()->try_register_callback([&] { calls.fetch_add(1); });
    assert(id != 0);
    assert(token.state()->callback_count() == 1);

    cts.cancel();
    cts.cancel();
    assert(calls.load() == 1);
    assert(token.is_cancelled());
    assert(token.state()->callback_count() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("registration after cancel is refused") {
    cancellation_source cts;
    cts.cancel();

    bool invoked = false;
    auto id = cts.token().state()->try_register_callback([&] { invoked = true; });
    assert(id == 0);
    assert(!invoked);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("unregister is idempotent") {
    cancellation_source cts;
    auto state = cts.token().state();
    bool invoked = false;

    auto id = state->try_register_callback([&] { invoked = true; });
    state->unregister_callback(id);
    state->unregister_callback(id);
    state->unregister_callback(0);
    cts.cancel();
    assert(!invoked);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("default token") {
    cancellation_token token;
    assert(!token.can_be_cancelled());
    assert(!token.is_cancelled());
    assert(!token);
    token.throw_if_cancelled();

    cancellation_source cts;
    auto a = cts.token();
    auto b = cts.token();
    assert(a == b);
    assert(!(a == token));

    cts.cancel();
    bool threw = false;
    try {
      a.throw_if_cancelled();
    } catch (const cancelled_exception &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Execution Context Tests
// =============================================================================

void test_execution_context() {
  TEST("captured context is a snapshot") {
    execution_context::clear();
    execution_context::set_value("tenant", "a");
    auto captured = execution_context::capture();

    execution_context::set_value("tenant", "b");
    assert(execution_context::get_value("tenant") == std::optional<std::string>("b"));

    {
      scoped_execution_context scope(captured);
      assert(execution_context::get_value("tenant") ==
             std::optional<std::string>("a"));
    }
    assert(execution_context::get_value("tenant") == std::optional<std::string>("b"));

    execution_context::clear();
    assert(!execution_context::get_value("tenant").has_value());
    assert(execution_context::capture().empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("contexts are per thread") {
    execution_context::set_value("tenant", "main");
    std::optional<std::string> seen = std::string("unset");
    std::thread t([&] { seen = execution_context::get_value("tenant"); });
    t.join();
    assert(!seen.has_value());
    execution_context::clear();

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Coroutine Task Tests
// =============================================================================

coro_task<int> answer() { co_return 42; }

coro_task<void> fails() {
  throw std::runtime_error("coro error");
  co_return;
}

coro_task<int> outer() {
  int inner = co_await answer();
  co_return inner * 2;
}

coro_task<void> bump(std::atomic<int> &counter) {
  counter.fetch_add(1);
  co_return;
}

void test_coro_task() {
  TEST("coro_task value") {
    auto task = answer();
    assert(!task.is_started());
    assert(task.get() == 42);
    assert(task.is_ready());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("coro_task exception") {
    auto task = fails();
    bool threw = false;
    try {
      task.get();
    } catch (const std::runtime_error &e) {
      threw = std::string(e.what()) == "coro error";
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("coro_task awaits another coro_task") {
    auto task = outer();
    assert(task.get() == 84);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("many coro_tasks") {
    std::atomic<int> counter{0};
    std::vector<coro_task<void>> tasks;
    for (int i = 0; i < 50; ++i) {
      tasks.push_back(bump(counter));
      tasks.back().start();
    }
    for (auto &t : tasks)
      t.get();
    assert(counter.load() == 50);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("unstarted coro_task is destroyed without running") {
    std::atomic<int> counter{0};
    {
      auto task = bump(counter);
    }
    assert(counter.load() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Allocator Tests
// =============================================================================

void test_allocator() {
  TEST("mimalloc resource accounting") {
    auto *resource = mi_resource();
    auto before = mi_resource_bytes_in_use();

    void *p = resource->allocate(256, 64);
    assert(p != nullptr);
    assert(reinterpret_cast<std::uintptr_t>(p) % 64 == 0);
    assert(mi_resource_bytes_in_use() == before + 256);

    resource->deallocate(p, 256, 64);
    assert(mi_resource_bytes_in_use() == before);
    assert(resource->is_equal(*mi_resource()));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("scheduler installs mimalloc as default resource") {
    get_task_scheduler();
    assert(std::pmr::get_default_resource() == mi_resource());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main(int, char **argv) {
  google::InitGoogleLogging(argv[0]);

  std::cout << "=== Runtime Tests ===" << std::endl << std::endl;

  std::cout << "--- Task Scheduler Tests ---" << std::endl;
  test_task_scheduler();
  std::cout << std::endl;

  std::cout << "--- Timer Service Tests ---" << std::endl;
  test_timer_service();
  std::cout << std::endl;

  std::cout << "--- Cancellation Tests ---" << std::endl;
  test_cancellation();
  std::cout << std::endl;

  std::cout << "--- Execution Context Tests ---" << std::endl;
  test_execution_context();
  std::cout << std::endl;

  std::cout << "--- Coroutine Task Tests ---" << std::endl;
  test_coro_task();
  std::cout << std::endl;

  std::cout << "--- Allocator Tests ---" << std::endl;
  test_allocator();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
