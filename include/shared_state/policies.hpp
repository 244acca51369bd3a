#ifndef COSYNC_SHARED_STATE_POLICIES_HPP
#define COSYNC_SHARED_STATE_POLICIES_HPP

#include <atomic>
#include <mutex>

namespace cosync {

// =============================================================================
// Lock Policies
// =============================================================================
//
// Every primitive guards its bookkeeping (idle flag, epoch, queues) with one
// lock. The lock is only ever held across synchronous state transitions, never
// across a suspension point or a call into the wrapped function.

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// Short critical sections only; the hold time is a handful of moves.
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

} // namespace cosync

#endif // COSYNC_SHARED_STATE_POLICIES_HPP
