#include "timer_service.hpp"
#include "task_scheduler.hpp"

#include <algorithm>
#include <functional>

namespace cosync {

timer_service::timer_service(task_scheduler &scheduler)
    : scheduler_(scheduler), thread_([this] { run(); }) {}

timer_service::~timer_service() { shutdown(); }

void timer_service::add_timer(std::chrono::steady_clock::time_point deadline,
                              std::coroutine_handle<> handle) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
      heap_.push_back(timer_entry{deadline, next_sequence_++, handle});
      std::push_heap(heap_.begin(), heap_.end(), std::greater<>{});
      cv_.notify_one();
      return;
    }
  }
  // Already shut down: fire right away
  scheduler_.schedule_coro_handle(handle);
}

void timer_service::shutdown() {
  std::vector<timer_entry> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return; // already shut down
    remaining.swap(heap_);
  }

  cv_.notify_one();
  if (thread_.joinable())
    thread_.join();

  // Fire in deadline order
  std::sort(remaining.begin(), remaining.end(),
            [](const timer_entry &a, const timer_entry &b) { return b > a; });
  for (auto &entry : remaining) {
    scheduler_.schedule_coro_handle(entry.handle);
  }
}

void timer_service::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_.load(std::memory_order_acquire)) {
    if (heap_.empty()) {
      cv_.wait(lock, [this] {
        return !heap_.empty() || !running_.load(std::memory_order_acquire);
      });
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    // By value: heap_ may reallocate while the wait below drops the lock
    auto deadline = heap_.front().deadline;

    if (deadline <= now) {
      std::pop_heap(heap_.begin(), heap_.end(), std::greater<>{});
      auto entry = heap_.back();
      heap_.pop_back();

      lock.unlock();
      scheduler_.schedule_coro_handle(entry.handle);
      lock.lock();
    } else {
      cv_.wait_until(lock, deadline);
    }
  }
}

} // namespace cosync
