#ifndef COSYNC_SLEEP_HPP
#define COSYNC_SLEEP_HPP

#include <chrono>
#include <coroutine>

#include "shared_state/crtp_base.hpp"
#include "timer_service.hpp"

namespace cosync {

// Suspends the awaiting coroutine until the deadline passes. The coroutine
// resumes on a scheduler worker, not on the timer thread.
class sleep_awaiter : public awaitable_base<sleep_awaiter, void> {
public:
  explicit sleep_awaiter(std::chrono::steady_clock::time_point deadline)
      : deadline_(deadline) {}

  bool ready_impl() const {
    return std::chrono::steady_clock::now() >= deadline_;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    get_timer_service().add_timer(deadline_, h);
    return true;
  }

  void resume_impl() {}

private:
  std::chrono::steady_clock::time_point deadline_;
};

// Sleep for a duration
template <typename Rep, typename Period>
sleep_awaiter sleep(std::chrono::duration<Rep, Period> duration) {
  return sleep_awaiter(
      std::chrono::steady_clock::now() +
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          duration));
}

// Sleep until a time point
inline sleep_awaiter sleep_until(std::chrono::steady_clock::time_point deadline) {
  return sleep_awaiter(deadline);
}

} // namespace cosync

#endif // COSYNC_SLEEP_HPP
