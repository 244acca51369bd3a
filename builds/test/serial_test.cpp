#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "coord/serial.hpp"
#include "coro_task.hpp"
#include "sleep.hpp"
#include "test_support.hpp"

using namespace cosync;
using namespace std::chrono_literals;

namespace {

struct cancel_log {
  std::mutex mutex;
  std::vector<std::pair<epoch_type, epoch_type>> calls;

  cancel_callback callback() {
    return [this](epoch_type current, epoch_type newest) {
      std::lock_guard<std::mutex> lock(mutex);
      calls.emplace_back(current, newest);
    };
  }
};

} // namespace

// =============================================================================
// Cancellation
// =============================================================================

void test_polling_body_cancelled() {
  TEST("serial cancels a polling round superseded by a newer call") {
    cancel_log log;
    std::atomic<int> polls{0};
    serial<int(int)> fn(
        [&polls](cancel_token token, int x) -> coro_task<int> {
          for (int i = 0; i < 3; ++i) {
            co_await sleep(100ms);
            polls.fetch_add(1);
            if (token.check_cancel() == cancel_status::cancelled)
              co_return -1;
          }
          co_return x * 2;
        },
        log.callback());

    auto a = fn(1);
    std::this_thread::sleep_for(150ms);
    auto b = fn(2);

    auto ra = a.get();
    auto rb = b.get();
    CHECK(ra.is_cancelled());
    CHECK(ra == serial_result<int>::cancelled());
    CHECK(!rb.is_cancelled());
    CHECK(rb.value() == 4);

    CHECK(log.calls.size() == 1);
    CHECK(log.calls[0].first == 1);
    CHECK(log.calls[0].second == 2);
    CHECK(fn.current_epoch() == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_final_check_without_polling() {
  TEST("serial applies the final check to a body that never polls") {
    cancel_log log;
    std::atomic<int> runs{0};
    serial<int(int)> fn(
        [&runs](cancel_token, int x) -> coro_task<int> {
          runs.fetch_add(1);
          co_await sleep(100ms);
          co_return x;
        },
        log.callback());

    auto a = fn(1);
    std::this_thread::sleep_for(20ms);
    auto b = fn(2);

    CHECK(a.get().status() == serial_status::cancelled);
    CHECK(b.get().value() == 2);
    CHECK(runs.load() == 2);
    CHECK(log.calls.size() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("serial value() of a cancelled result throws") {
    serial<int()> fn([](cancel_token) -> coro_task<int> {
      co_await sleep(50ms);
      co_return 1;
    });

    auto a = fn();
    auto b = fn();
    auto ra = a.get();
    CHECK(!ra);
    CHECK_THROWS_AS(ra.value(), cancelled_exception);
    CHECK(b.get().value() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_epochs() {
  TEST("serial hands each round its own epoch") {
    std::mutex mutex;
    std::vector<epoch_type> seen;
    serial<epoch_type()> fn([&](cancel_token token) {
      std::lock_guard<std::mutex> lock(mutex);
      seen.push_back(token.epoch());
      return token.epoch();
    });

    CHECK(fn.current_epoch() == 0);
    CHECK(fn().get().value() == 1);
    CHECK(fn().get().value() == 2);
    CHECK(fn.current_epoch() == 2);
    CHECK(seen.size() == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Exceptions
// =============================================================================

void test_exceptions() {
  TEST("serial propagates an exception of the current round") {
    serial<int(int)> fn([](cancel_token, int x) -> int {
      if (x < 0)
        throw std::domain_error("bad input");
      return x;
    });

    CHECK_THROWS_AS(fn(-1).get(), std::domain_error);
    CHECK(fn(3).get().value() == 3);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("serial suppresses the exception of a cancelled round") {
    cancel_log log;
    serial<void(bool)> fn(
        [](cancel_token, bool fail) -> coro_task<void> {
          co_await sleep(80ms);
          if (fail)
            throw std::runtime_error("stale failure");
        },
        log.callback());

    auto a = fn(true);
    std::this_thread::sleep_for(20ms);
    auto b = fn(false);

    CHECK(a.get().is_cancelled());
    CHECK(!b.get().is_cancelled());
    CHECK(log.calls.size() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("serial turns throw_if_cancelled into a cancelled result") {
    cancel_log log;
    serial<int()> fn(
        [](cancel_token token) -> coro_task<int> {
          co_await sleep(80ms);
          token.throw_if_cancelled();
          co_return 5;
        },
        log.callback());

    auto a = fn();
    std::this_thread::sleep_for(20ms);
    auto b = fn();

    CHECK(a.get().is_cancelled());
    CHECK(b.get().value() == 5);
    // Both the mid-round and the final check saw the cancel; callback ran once
    CHECK(log.calls.size() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Serial Tests ===" << std::endl << std::endl;

  std::cout << "--- Cancellation ---" << std::endl;
  test_polling_body_cancelled();
  test_final_check_without_polling();
  test_epochs();
  std::cout << std::endl;

  std::cout << "--- Exceptions ---" << std::endl;
  test_exceptions();
  std::cout << std::endl;

  return report_results();
}
