#ifndef COSYNC_TIMER_SERVICE_HPP
#define COSYNC_TIMER_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace cosync {

class task_scheduler;

struct timer_entry {
  std::chrono::steady_clock::time_point deadline;
  std::uint64_t sequence;
  std::coroutine_handle<> handle;

  // Min-heap: earliest deadline first, insertion order among equals
  bool operator>(const timer_entry &other) const {
    if (deadline != other.deadline)
      return deadline > other.deadline;
    return sequence > other.sequence;
  }
};

// One thread sleeping on the earliest deadline. Expired handles are handed to
// the scheduler, never resumed on the timer thread itself.
class timer_service {
public:
  explicit timer_service(task_scheduler &scheduler);
  ~timer_service();

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  void add_timer(std::chrono::steady_clock::time_point deadline,
                 std::coroutine_handle<> handle);

  // Fires every pending timer early so no coroutine hangs.
  void shutdown();

private:
  void run();

  task_scheduler &scheduler_;
  std::vector<timer_entry> heap_;
  std::uint64_t next_sequence_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  std::thread thread_;
};

timer_service &get_timer_service();

} // namespace cosync

#endif // COSYNC_TIMER_SERVICE_HPP
