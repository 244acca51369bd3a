#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "async_runtime.hpp"
#include "coord/rw_lock.hpp"
#include "coro_task.hpp"
#include "shared_state/policies.hpp"
#include "sleep.hpp"
#include "test_support.hpp"

using namespace cosync;
using namespace std::chrono_literals;

// =============================================================================
// Blocking API
// =============================================================================

void test_concurrent_readers() {
  TEST("rw_lock admits several readers at once") {
    rw_lock<std::string> lock("guarded");

    auto r1 = lock.read().get();
    auto r2 = lock.read().get();
    auto r3 = lock.try_read();

    CHECK(r3.has_value());
    CHECK(lock.readers() == 3);
    CHECK(*r1 == "guarded");
    CHECK(r2->size() == 7);
    CHECK(!lock.try_write().has_value());

    r1.release();
    r2.release();
    r3.reset();
    CHECK(lock.readers() == 0);
    CHECK(lock.try_write().has_value());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_writer_waits_for_readers() {
  TEST("rw_lock writer waits for active readers") {
    rw_lock<int> lock(1);
    std::atomic<bool> written{false};

    auto r1 = lock.read().get();
    auto r2 = lock.read().get();

    std::thread writer([&] {
      auto w = lock.write().get();
      *w = 2;
      written.store(true);
    });

    // Observed while the writer runs, checked once it is joined
    bool queued = eventually([&] { return lock.waiting() == 1; });
    std::this_thread::sleep_for(20ms);
    bool held_by_two = !written.load();

    r1.release();
    std::this_thread::sleep_for(20ms);
    bool held_by_one = !written.load();

    r2.release();
    writer.join();
    CHECK(queued);
    CHECK(held_by_two);
    CHECK(held_by_one);
    CHECK(written.load());
    CHECK(*lock.read().get() == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_reads_queue_behind_waiting_writer() {
  TEST("rw_lock new reads queue behind a waiting writer") {
    rw_lock<int> lock(0);
    std::vector<std::string> order;
    std::mutex order_mutex;
    auto record = [&](std::string what) {
      std::lock_guard<std::mutex> guard(order_mutex);
      order.push_back(std::move(what));
    };

    auto first_reader = lock.read().get();

    std::thread writer([&] {
      auto w = lock.write().get();
      record("write");
      *w = 7;
    });
    bool writer_queued = eventually([&] { return lock.waiting() == 1; });

    // Would be compatible with the active reader, but the writer came first
    bool try_read_refused = !lock.try_read().has_value();

    std::thread late_reader([&] {
      auto r = lock.read().get();
      record("read " + std::to_string(*r));
    });
    bool reader_queued = eventually([&] { return lock.waiting() == 2; });

    first_reader.release();
    writer.join();
    late_reader.join();

    CHECK(writer_queued);
    CHECK(try_read_refused);
    CHECK(reader_queued);

    CHECK(order.size() == 2);
    CHECK(order[0] == "write");
    CHECK(order[1] == "read 7");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_exclusive_writers() {
  TEST("rw_lock never holds two write guards") {
    rw_lock<int, spinlock_policy> lock(0);
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([&] {
        for (int j = 0; j < 200; ++j) {
          auto w = lock.write().get();
          if (inside.fetch_add(1) != 0)
            overlap.store(true);
          *w += 1;
          inside.fetch_sub(1);
        }
      });
    }
    for (auto &t : threads)
      t.join();

    CHECK(!overlap.load());
    CHECK(*lock.read().get() == 800);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Coroutine API
// =============================================================================

void test_awaited_guards() {
  TEST("rw_lock guards awaited from coroutines") {
    rw_lock<std::vector<int>> lock;

    auto appender = [&lock](int value) -> coro_task<void> {
      auto w = co_await lock.write();
      w->push_back(value);
      co_await sleep(5ms);
      w.release();
    };

    std::vector<coro_task<void>> tasks;
    for (int i = 0; i < 5; ++i)
      tasks.push_back(appender(i));
    block_on(when_all(std::move(tasks)));

    auto reader = [&lock]() -> coro_task<std::size_t> {
      auto r = co_await lock.read();
      co_return r->size();
    };
    CHECK(block_on(reader()) == 5);

    auto replacer = [&lock]() -> coro_task<void> {
      auto w = co_await lock.write();
      w.release(std::vector<int>{9});
      CHECK(!w.owns_lock());
    };
    block_on(replacer());

    auto r = lock.read().get();
    CHECK(r->size() == 1);
    CHECK(r->front() == 9);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("rw_lock wakes a suspended writer after the last reader") {
    rw_lock<int> lock(0);
    auto r = lock.read().get();

    auto writer = [&lock]() -> coro_task<int> {
      auto w = co_await lock.write();
      *w = 11;
      co_return *w;
    };
    auto task = writer();
    task.start();

    CHECK(eventually([&] { return lock.waiting() == 1; }));
    CHECK(!task.is_ready());

    r.release();
    CHECK(task.get() == 11);
    CHECK(!lock.writer_active());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== RwLock Tests ===" << std::endl << std::endl;

  std::cout << "--- Blocking API ---" << std::endl;
  test_concurrent_readers();
  test_writer_waits_for_readers();
  test_reads_queue_behind_waiting_writer();
  test_exclusive_writers();
  std::cout << std::endl;

  std::cout << "--- Coroutine API ---" << std::endl;
  test_awaited_guards();
  std::cout << std::endl;

  return report_results();
}
