#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "coord/debounce.hpp"
#include "coro_task.hpp"
#include "sleep.hpp"
#include "test_support.hpp"

using namespace cosync;
using namespace std::chrono_literals;

namespace {

using clock_type = std::chrono::steady_clock;

// Records (argument, start time) of every execution.
struct execution_log {
  std::mutex mutex;
  std::vector<int> args;
  std::vector<clock_type::time_point> starts;

  void record(int arg) {
    std::lock_guard<std::mutex> lock(mutex);
    args.push_back(arg);
    starts.push_back(clock_type::now());
  }

  std::size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    return args.size();
  }
};

} // namespace

// =============================================================================
// Coalescing
// =============================================================================

void test_idle_call_runs_immediately() {
  TEST("debounce runs an idle call without delay") {
    execution_log log;
    debounce<int(int)> fn(
        [&log](int x) {
          log.record(x);
          return x + 1;
        },
        debounce_config{100ms});

    auto start = clock_type::now();
    CHECK(fn(1).get() == 2);
    CHECK(elapsed_ms(start, clock_type::now()) < 50);
    CHECK(log.count() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_burst_coalesces() {
  TEST("debounce collapses a burst into one trailing call") {
    execution_log log;
    debounce<int(int)> fn(
        [&log](int x) {
          log.record(x);
          return x * 10;
        },
        debounce_config{100ms});

    auto a = fn(1);
    std::this_thread::sleep_for(10ms);
    auto b = fn(2);
    std::this_thread::sleep_for(10ms);
    auto c = fn(3);

    CHECK(a.get() == 10);
    CHECK(b.get() == 30);
    CHECK(c.get() == 30);
    CHECK(b.shares_state_with(c));
    CHECK(!a.shares_state_with(b));

    CHECK(log.count() == 2);
    CHECK(log.args[0] == 1);
    CHECK(log.args[1] == 3);
    CHECK(elapsed_ms(log.starts[0], log.starts[1]) >= 90);

    CHECK(eventually([&] { return fn.is_idle(); }));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Scheduling
// =============================================================================

void test_waits_for_slow_execution() {
  TEST("debounce never overlaps a slow execution") {
    execution_log log;
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    debounce<int(int)> fn(
        [&](int x) -> coro_task<int> {
          log.record(x);
          int now = running.fetch_add(1) + 1;
          if (now > max_running.load())
            max_running.store(now);
          co_await sleep(300ms);
          running.fetch_sub(1);
          co_return x;
        },
        debounce_config{100ms});

    auto a = fn(1);
    std::this_thread::sleep_for(50ms);
    auto b = fn(2);

    CHECK(a.get() == 1);
    CHECK(b.get() == 2);
    CHECK(max_running.load() == 1);
    CHECK(elapsed_ms(log.starts[0], log.starts[1]) >= 290);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("debounce disregarding execution time starts on the timer") {
    execution_log log;
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    debounce<int(int)> fn(
        [&](int x) -> coro_task<int> {
          log.record(x);
          int now = running.fetch_add(1) + 1;
          if (now > max_running.load())
            max_running.store(now);
          co_await sleep(300ms);
          running.fetch_sub(1);
          co_return x;
        },
        debounce_config{100ms, true});

    auto a = fn(1);
    std::this_thread::sleep_for(50ms);
    auto b = fn(2);

    CHECK(a.get() == 1);
    CHECK(b.get() == 2);
    CHECK(max_running.load() == 2);

    auto gap = elapsed_ms(log.starts[0], log.starts[1]);
    CHECK(gap >= 90);
    CHECK(gap < 250);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_zero_interval_passthrough() {
  TEST("debounce with a zero interval passes every call through") {
    execution_log log;
    debounce<int(int)> fn(
        [&log](int x) {
          log.record(x);
          return x;
        },
        debounce_config{0ms});

    auto a = fn(1);
    auto b = fn(2);
    auto c = fn(3);
    CHECK(a.get() + b.get() + c.get() == 6);
    CHECK(log.count() == 3);
    CHECK(fn.is_idle());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_failure_reaches_round() {
  TEST("debounce rejects every caller of a failed round") {
    std::atomic<int> calls{0};
    debounce<int(int)> fn(
        [&calls](int x) -> int {
          calls.fetch_add(1);
          if (x < 0)
            throw std::invalid_argument("negative");
          return x;
        },
        debounce_config{50ms});

    auto ok = fn(1);
    auto bad1 = fn(-1);
    auto bad2 = fn(-2);

    CHECK(ok.get() == 1);
    CHECK_THROWS_AS(bad1.get(), std::invalid_argument);
    CHECK_THROWS_AS(bad2.get(), std::invalid_argument);
    CHECK(calls.load() == 2);

    // Still usable afterwards
    CHECK(eventually([&] { return fn.is_idle(); }));
    CHECK(fn(5).get() == 5);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Debounce Tests ===" << std::endl << std::endl;

  std::cout << "--- Coalescing ---" << std::endl;
  test_idle_call_runs_immediately();
  test_burst_coalesces();
  std::cout << std::endl;

  std::cout << "--- Scheduling ---" << std::endl;
  test_waits_for_slow_execution();
  test_zero_interval_passthrough();
  test_failure_reaches_round();
  std::cout << std::endl;

  return report_results();
}
