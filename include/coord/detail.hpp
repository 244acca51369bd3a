#ifndef COSYNC_COORD_DETAIL_HPP
#define COSYNC_COORD_DETAIL_HPP

#include <atomic>
#include <chrono>

namespace cosync {

// Trailing interval shared by debounce and batch.
struct interval_config {
  std::chrono::steady_clock::duration interval{};
  // Open the next window when the timer fires, even if the execution that
  // opened this one is still running.
  bool disregard_execution_time{false};
};

namespace detail {

// Tracks one execution window. The next round may start once both the timer
// and the execution have reported in; with disregard_execution_time the timer
// alone decides. Exactly one of the reporting calls returns true.
class interval_window {
public:
  explicit interval_window(bool disregard_execution_time)
      : timer_only_(disregard_execution_time),
        pending_(disregard_execution_time ? 1 : 2) {}

  interval_window(const interval_window &) = delete;
  interval_window &operator=(const interval_window &) = delete;

  bool timer_elapsed() {
    return pending_.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

  bool execution_finished() {
    if (timer_only_)
      return false;
    return pending_.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

private:
  const bool timer_only_;
  std::atomic<int> pending_;
};

} // namespace detail

} // namespace cosync

#endif // COSYNC_COORD_DETAIL_HPP
