#ifndef COSYNC_COORD_DEBOUNCE_HPP
#define COSYNC_COORD_DEBOUNCE_HPP

#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>

#include "async_function.hpp"
#include "coord/detail.hpp"
#include "coro_task.hpp"
#include "shared_state/future.hpp"
#include "shared_state/policies.hpp"
#include "sleep.hpp"

namespace cosync {

using debounce_config = interval_config;

template <typename Signature, typename LockPolicy = mutex_lock_policy>
class debounce;

// =============================================================================
// debounce<R(Args...)> - one execution per interval, latest arguments win
// =============================================================================
//
// An idle debounce runs fn at once. Calls made while busy collapse into a
// single queued call that keeps only the newest arguments; all of those callers
// share its future. The queued call starts at the trailing edge of the window
// opened by the previous start (see interval_config).
//
// A non-positive interval turns the wrapper into a plain pass-through.

template <typename R, typename... Args, typename LockPolicy>
class debounce<R(Args...), LockPolicy> {
public:
  using function_type = async_function<R(Args...)>;
  using args_tuple = std::tuple<Args...>;

  debounce(function_type fn, debounce_config config)
      : state_(std::make_shared<state>(std::move(fn), config)) {}

  async_future<R> operator()(Args... args) const {
    args_tuple call_args(std::move(args)...);

    if (state_->config.interval <= std::chrono::steady_clock::duration::zero()) {
      async_promise<R> promise;
      auto future = promise.get_future();
      detail::deliver(state_->fn, std::move(call_args), std::move(promise));
      return future;
    }

    typename LockPolicy::lock_type lock(state_->mutex);
    if (auto *busy = std::get_if<busy_state>(&state_->phase)) {
      if (busy->next) {
        busy->next->args = std::move(call_args);
      } else {
        busy->next.emplace(std::move(call_args));
      }
      return busy->next->future;
    }

    state_->phase = busy_state{};
    lock.unlock();

    async_promise<R> promise;
    auto future = promise.get_future();
    execute(state_, std::move(call_args), std::move(promise));
    return future;
  }

  bool is_idle() const {
    typename LockPolicy::lock_type lock(state_->mutex);
    return std::holds_alternative<idle_state>(state_->phase);
  }

private:
  struct queued_call {
    explicit queued_call(args_tuple a)
        : args(std::move(a)), future(promise.get_future()) {}

    args_tuple args;
    async_promise<R> promise;
    async_future<R> future;
  };

  struct idle_state {};
  struct busy_state {
    std::optional<queued_call> next;
  };

  struct state {
    state(function_type f, debounce_config c) : fn(std::move(f)), config(c) {}

    function_type fn;
    const debounce_config config;
    typename LockPolicy::mutex_type mutex;
    std::variant<idle_state, busy_state> phase;
  };

  using state_ptr = std::shared_ptr<state>;

  static detached_task execute(state_ptr s, args_tuple args,
                               async_promise<R> promise) {
    auto window = std::make_shared<detail::interval_window>(
        s->config.disregard_execution_time);
    close_window_after(s, window,
                       std::chrono::steady_clock::now() + s->config.interval);

    auto result = co_await detail::invoke_captured(s->fn, std::move(args));
    promise.settle(std::move(result));

    if (window->execution_finished())
      schedule_next(s);
  }

  static detached_task
  close_window_after(state_ptr s,
                     std::shared_ptr<detail::interval_window> window,
                     std::chrono::steady_clock::time_point deadline) {
    co_await sleep_until(deadline);
    if (window->timer_elapsed())
      schedule_next(s);
  }

  // Starts the queued call, or goes idle when nothing arrived in the window.
  static void schedule_next(const state_ptr &s) {
    std::optional<queued_call> next;
    {
      typename LockPolicy::lock_type lock(s->mutex);
      auto &busy = std::get<busy_state>(s->phase);
      if (!busy.next) {
        s->phase = idle_state{};
        return;
      }
      next.swap(busy.next);
    }
    execute(s, std::move(next->args), std::move(next->promise));
  }

  state_ptr state_;
};

} // namespace cosync

#endif // COSYNC_COORD_DEBOUNCE_HPP
