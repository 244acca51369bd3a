#ifndef COSYNC_TASK_SCHEDULER_HPP
#define COSYNC_TASK_SCHEDULER_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

/*
  Every coroutine resumption in cosync goes through here. Workers pull handles
  from one shared FIFO; there is no per-worker deque and no stealing, the
  primitives only ever schedule short continuations and wake-ups. Once the
  scheduler is shut down, anything still handed to it runs inline on the
  caller's thread so that no suspended coroutine is left behind.
*/

namespace cosync {

struct scheduler_config {
  // 0 picks std::thread::hardware_concurrency(), at least 2.
  std::size_t worker_count{0};
};

class task_scheduler {
public:
  explicit task_scheduler(scheduler_config config = {});
  ~task_scheduler();

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;

  // Schedule a coroutine handle on a worker
  void schedule_coro_handle(std::coroutine_handle<> handle);

  // Joins the workers, then drains what is left on the calling thread.
  void shutdown();

  std::size_t worker_count() const noexcept { return workers_.size(); }

  // True on a thread owned by any task_scheduler.
  static bool on_worker_thread() noexcept;

private:
  void worker_loop();
  static void resume_handle(std::coroutine_handle<> handle) noexcept;

  std::vector<std::thread> workers_;
  std::deque<std::coroutine_handle<>> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> shutting_down_{false};
  std::atomic<bool> stopped_{false};
};

} // namespace cosync

#endif // COSYNC_TASK_SCHEDULER_HPP
