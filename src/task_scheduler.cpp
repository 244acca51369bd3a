#include <exception>
#include <utility>

#include "diagnostics.hpp"
#include "task_scheduler.hpp"

namespace cosync {

namespace {
thread_local bool is_coro_worker = false;
} // namespace

task_scheduler::task_scheduler(scheduler_config config) {
  std::size_t num_workers = config.worker_count;
  if (num_workers == 0) {
    num_workers = std::thread::hardware_concurrency();
    if (num_workers < 2)
      num_workers = 2;
  }

  workers_.reserve(num_workers);
  for (std::size_t i = 0; i < num_workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

task_scheduler::~task_scheduler() { shutdown(); }

bool task_scheduler::on_worker_thread() noexcept { return is_coro_worker; }

void task_scheduler::resume_handle(std::coroutine_handle<> handle) noexcept {
  try {
    handle.resume();
  } catch (...) {
    // Coroutine bodies store their own exceptions; anything reaching here
    // escaped an awaiter or a final_suspend.
    report_unhandled_exception(std::current_exception());
  }
}

void task_scheduler::worker_loop() {
  is_coro_worker = true;

  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] {
      return !queue_.empty() ||
             shutting_down_.load(std::memory_order_acquire);
    });

    if (queue_.empty()) {
      // shutting down with nothing queued
      return;
    }

    auto handle = queue_.front();
    queue_.pop_front();
    lock.unlock();
    resume_handle(handle);
    lock.lock();
  }
}

void task_scheduler::schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;

  if (stopped_.load(std::memory_order_acquire) || workers_.empty()) {
    // Run inline after shutdown
    resume_handle(handle);
    return;
  }

  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_.load(std::memory_order_relaxed)) {
      lock.unlock();
      resume_handle(handle);
      return;
    }
    queue_.push_back(handle);
  }
  cv_.notify_one();
}

void task_scheduler::shutdown() {
  if (shutting_down_.exchange(true, std::memory_order_acq_rel))
    return; // already shut down

  cv_.notify_all();

  // Workers keep draining until the queue is empty, then exit.
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }

  std::deque<std::coroutine_handle<>> leftovers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.store(true, std::memory_order_release);
    leftovers.swap(queue_);
  }
  for (auto handle : leftovers) {
    resume_handle(handle);
  }
}

} // namespace cosync
