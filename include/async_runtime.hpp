#ifndef COSYNC_ASYNC_RUNTIME_HPP
#define COSYNC_ASYNC_RUNTIME_HPP

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include "coro_task.hpp"
#include "task_scheduler.hpp"
#include "timer_service.hpp"

namespace cosync {

// =============================================================================
// Async Runtime - the worker pool and timer thread every primitive runs on
// =============================================================================

struct runtime_config {
  // 0 picks std::thread::hardware_concurrency(), at least 2.
  std::size_t worker_count{0};
};

class async_runtime {
public:
  explicit async_runtime(runtime_config config = {});
  ~async_runtime();

  async_runtime(const async_runtime &) = delete;
  async_runtime &operator=(const async_runtime &) = delete;

  task_scheduler &scheduler() noexcept { return scheduler_; }
  timer_service &timers() noexcept { return timers_; }

  // Stops the timer thread (firing what is pending), then the workers.
  void shutdown();

  // Block on a coroutine from non-coroutine context. Refused on a worker
  // thread, where the awaited work may need that very worker.
  template <typename T> T block_on(coro_task<T> task) {
    if (task_scheduler::on_worker_thread())
      throw std::logic_error("cosync: block_on called from a worker thread");
    return task.get();
  }

  // Spawn and detach (fire-and-forget). An exception escaping the task goes
  // to the unhandled exception handler.
  template <typename T> void spawn_detached(coro_task<T> task) {
    drive_detached(std::move(task));
  }

private:
  template <typename T> static detached_task drive_detached(coro_task<T> task) {
    co_await task;
  }

  // Declaration order matters: the timer thread must go first.
  task_scheduler scheduler_;
  timer_service timers_;
};

// Must run before the first get_runtime(); throws std::logic_error after.
void configure_runtime(runtime_config config);

// Created lazily with the configured settings; lives until program exit.
async_runtime &get_runtime();

template <typename T> T block_on(coro_task<T> task) {
  return get_runtime().block_on(std::move(task));
}

template <typename T> void spawn_detached(coro_task<T> task) {
  get_runtime().spawn_detached(std::move(task));
}

// =============================================================================
// Structured Concurrency: when_all
// =============================================================================

// Wait for all tasks to complete, return vector of results
template <typename T>
coro_task<std::vector<T>> when_all(std::vector<coro_task<T>> tasks) {
  // Start all tasks
  for (auto &t : tasks) {
    t.start();
  }

  // Await all results in order
  std::vector<T> results;
  results.reserve(tasks.size());
  for (auto &t : tasks) {
    results.push_back(co_await t);
  }

  co_return results;
}

// Specialization for void tasks
inline coro_task<void> when_all(std::vector<coro_task<void>> tasks) {
  for (auto &t : tasks) {
    t.start();
  }

  for (auto &t : tasks) {
    co_await t;
  }

  co_return;
}

} // namespace cosync

#endif // COSYNC_ASYNC_RUNTIME_HPP
