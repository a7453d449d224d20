#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
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

// Completes a rented node and consumes its result, which sends it home
template <typename Node> bool complete_and_consume(Node &node, bool value) {
  auto token = *node.prepare_wait(infinite_timeout);
  node.try_set_result(value);
  return node.get_result(token);
}

// =============================================================================
// Bounded Pool Tests
// =============================================================================

void test_bounded_pool() {
  TEST("bounded pool preallocates and exhausts") {
    bounded_wait_node_pool<wait_node> pool(2, false);
    assert(pool.capacity() == 2);
    assert(pool.available() == 2);

    auto a = pool.rent();
    auto b = pool.rent();
    assert(a && b && a != b);
    assert(pool.available() == 0);

    bool threw = false;
    try {
      pool.rent();
    } catch (const pool_exhausted_error &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("consumed node returns to the bounded pool reset") {
    bounded_wait_node_pool<wait_node> pool(1, false);
    auto node = pool.rent();
    auto first_version = node->version();

    assert(complete_and_consume(*node, true));
    assert(pool.available() == 1);
    assert(node->status() == completion_source_status::wait_for_activation);
    assert(node->version() == static_cast<std::int16_t>(first_version + 1));

    auto again = pool.rent();
    assert(again == node);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("node outliving its pool is dropped") {
    std::shared_ptr<wait_node> node;
    {
      bounded_wait_node_pool<wait_node> pool(1, false);
      node = pool.rent();
    }
    assert(!complete_and_consume(*node, false));
    assert(node->status() == completion_source_status::wait_for_activation);
    assert(node.use_count() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Unbounded Pool Tests
// =============================================================================

void test_unbounded_pool() {
  TEST("unbounded pool grows on demand") {
    unbounded_wait_node_pool<wait_node> pool(false);
    assert(pool.available() == 0);

    std::vector<std::shared_ptr<wait_node>> nodes;
    std::set<wait_node *> distinct;
    for (int i = 0; i < 16; ++i) {
      nodes.push_back(pool.rent());
      distinct.insert(nodes.back().get());
    }
    assert(distinct.size() == 16);

    for (auto &n : nodes)
      complete_and_consume(*n, true);
    assert(pool.available() == 16);

    auto reused = pool.rent();
    assert(distinct.count(reused.get()) == 1);
    assert(pool.available() == 15);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("unbounded pool allocates through mimalloc") {
    unbounded_wait_node_pool<wait_node> pool(false);
    auto before = mi_resource_bytes_in_use();
    {
      auto node = pool.rent();
      assert(mi_resource_bytes_in_use() > before);
    }
    // Never consumed: the node is not returned and its memory goes back
    assert(mi_resource_bytes_in_use() == before);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("make_wait_node_pool selects by concurrency level") {
    async_lock_options unbounded;
    auto a = make_wait_node_pool<wait_node>(unbounded);
    assert(dynamic_cast<unbounded_wait_node_pool<wait_node> *>(a.get()));

    async_lock_options bounded;
    bounded.concurrency_level = 3;
    auto b = make_wait_node_pool<wait_node>(bounded);
    auto *typed = dynamic_cast<bounded_wait_node_pool<wait_node> *>(b.get());
    assert(typed && typed->capacity() == 3 && b->available() == 3);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Wait Node Tests
// =============================================================================

void test_wait_node() {
  TEST("timeout yields false when configured") {
    unbounded_wait_node_pool<wait_node> pool(false);
    auto node = pool.rent();
    node->throw_on_timeout(false);

    auto token = *node->prepare_wait(15ms);
    value_task<bool> task(node, token);
    assert(task.get() == false);
    assert(pool.available() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("timeout throws by default") {
    unbounded_wait_node_pool<wait_node> pool(false);
    auto node = pool.rent();

    auto token = *node->prepare_wait(15ms);
    value_task<bool> task(node, token);
    bool timed_out = false;
    try {
      task.get();
    } catch (const timeout_error &) {
      timed_out = true;
    }
    assert(timed_out);
    assert(pool.available() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("recycled node ignores the previous wait's timer") {
    bounded_wait_node_pool<wait_node> pool(1, false);
    auto node = pool.rent();
    node->throw_on_timeout(false);

    auto token = *node->prepare_wait(30ms);
    node->try_set_result(true);
    assert(node->get_result(token));

    auto same = pool.rent();
    assert(same == node);
    auto next = *same->prepare_wait(infinite_timeout);
    std::this_thread::sleep_for(70ms);
    assert(same->status() == completion_source_status::activated);

    same->try_set_result(true);
    assert(same->get_result(next));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("unlinked node is not linked") {
    unbounded_wait_node_pool<wait_node> pool(false);
    auto node = pool.rent();
    assert(!node->is_linked());

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

  std::cout << "=== Wait Node Pool Tests ===" << std::endl << std::endl;

  std::cout << "--- Bounded Pool Tests ---" << std::endl;
  test_bounded_pool();
  std::cout << std::endl;

  std::cout << "--- Unbounded Pool Tests ---" << std::endl;
  test_unbounded_pool();
  std::cout << std::endl;

  std::cout << "--- Wait Node Tests ---" << std::endl;
  test_wait_node();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
