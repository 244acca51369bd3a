#ifndef COSYNC_CORO_TASK_HPP
#define COSYNC_CORO_TASK_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

#include "diagnostics.hpp"
#include "shared_state/continuation_handoff.hpp"
#include "shared_state/crtp_base.hpp"

namespace cosync {

// Forward declaration for scheduler integration
void schedule_coro_handle(std::coroutine_handle<> handle);

namespace detail {

// Outlives the coroutine frame: the frame destroys itself at final suspend,
// the task handle and any blocked getter keep reading from here.
template <typename T> struct task_state {
  outcome<T> result;
  continuation_handoff handoff;
  std::mutex mutex;
  std::condition_variable cv;
  bool finished{false};

  void mark_finished() {
    {
      std::lock_guard lock(mutex);
      finished = true;
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return finished; });
  }
};

template <typename T> struct task_promise_base {
  std::shared_ptr<task_state<T>> state = std::make_shared<task_state<T>>();

  std::suspend_always initial_suspend() noexcept { return {}; }

  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      auto state = std::move(h.promise().state);
      h.destroy();
      state->mark_finished();
      if (state->handoff.signal_ready()) {
        return state->handoff.continuation();
      }
      return std::noop_coroutine();
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() {
    state->result.set_exception(std::current_exception());
  }
};

template <typename T> struct task_promise : task_promise_base<T> {
  void return_value(T value) { this->state->result.set_value(std::move(value)); }
};

template <> struct task_promise<void> : task_promise_base<void> {
  void return_void() { this->state->result.set_value(); }
};

} // namespace detail

// =============================================================================
// coro_task<T> - lazy coroutine, started on the scheduler when awaited
// =============================================================================

template <typename T = void> class coro_task {
public:
  struct promise_type : detail::task_promise<T> {
    coro_task get_return_object() {
      return coro_task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }
  };
  using handle_type = std::coroutine_handle<promise_type>;

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load()) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      release();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load());
    }
    return *this;
  }

  // A started task keeps running detached; its frame frees itself.
  ~coro_task() { release(); }

  bool await_ready() const noexcept {
    return state_ && state_->handoff.is_ready();
  }

  // Park the continuation before starting, so a task that finishes on
  // another worker before we return still finds it.
  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) {
    auto resume_now = state_->handoff.offer(awaiting);
    start();
    return resume_now;
  }

  T await_resume() { return state_->result.get(); }

  // Blocking get for non-coroutine contexts
  T get() {
    start();
    state_->wait();
    return state_->result.get();
  }

  bool is_ready() const { return state_ && state_->handoff.is_ready(); }

  void start() {
    bool expected = false;
    if (handle_ && started_.compare_exchange_strong(expected, true)) {
      schedule_coro_handle(handle_);
    }
  }

  bool is_started() const { return started_.load(); }

private:
  explicit coro_task(handle_type h)
      : handle_(h), state_(h.promise().state), started_(false) {}

  void release() noexcept {
    if (handle_ && !started_.load()) {
      handle_.destroy();
    }
    handle_ = nullptr;
  }

  handle_type handle_;
  std::shared_ptr<detail::task_state<T>> state_;
  std::atomic<bool> started_;
};

// =============================================================================
// detached_task - eager fire-and-forget coroutine
// =============================================================================
//
// Runs on the calling thread up to its first suspension and frees its own
// frame when done. Used to drive wrapped functions whose completion is
// published through an async_promise rather than a task handle.

struct detached_task {
  struct promise_type {
    detached_task get_return_object() noexcept { return {}; }
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() noexcept {}
    void unhandled_exception() noexcept {
      report_unhandled_exception(std::current_exception());
    }
  };
};

} // namespace cosync

#endif // COSYNC_CORO_TASK_HPP
