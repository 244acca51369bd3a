#ifndef COSYNC_COORD_BATCH_HPP
#define COSYNC_COORD_BATCH_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "async_function.hpp"
#include "coord/detail.hpp"
#include "coro_task.hpp"
#include "shared_state/future.hpp"
#include "shared_state/policies.hpp"
#include "sleep.hpp"

namespace cosync {

using batch_config = interval_config;

namespace detail {

template <typename R, typename Tuple> struct unbatch_function {
  using type =
      std::function<std::vector<R>(const std::vector<Tuple> &, const R &)>;
};

// Nothing to split for a void result.
template <typename Tuple> struct unbatch_function<void, Tuple> {
  using type = std::nullptr_t;
};

} // namespace detail

template <typename Signature, typename LockPolicy = mutex_lock_policy>
class batch;

// =============================================================================
// batch<R(Args...)> - merge the calls of one window into a single execution
// =============================================================================
//
// An idle batch runs fn at once with the caller's own arguments. Calls made
// while busy are queued until the trailing edge of the window. One queued call
// runs as is. Two or more are merged by batch_fn, in arrival order, and fn runs
// once on the merged arguments. Every queued caller then receives the whole
// output, or its positional share when unbatch is given.
//
// A failure of fn, batch_fn or unbatch rejects every caller of that round with
// the same exception; later rounds are unaffected.

template <typename R, typename... Args, typename LockPolicy>
class batch<R(Args...), LockPolicy> {
public:
  using function_type = async_function<R(Args...)>;
  using args_tuple = std::tuple<Args...>;
  using batch_function =
      std::function<args_tuple(const std::vector<args_tuple> &)>;
  using unbatch_function =
      typename detail::unbatch_function<R, args_tuple>::type;

  batch(function_type fn, batch_function batch_fn, batch_config config,
        unbatch_function unbatch = {})
      : state_(std::make_shared<state>(std::move(fn), std::move(batch_fn),
                                       std::move(unbatch), config)) {}

  async_future<R> operator()(Args... args) const {
    args_tuple call_args(std::move(args)...);
    async_promise<R> promise;
    auto future = promise.get_future();

    typename LockPolicy::lock_type lock(state_->mutex);
    if (auto *busy = std::get_if<busy_state>(&state_->phase)) {
      busy->queued.inputs.push_back(std::move(call_args));
      busy->queued.promises.push_back(std::move(promise));
      return future;
    }

    state_->phase = busy_state{};
    lock.unlock();

    round first;
    first.inputs.push_back(call_args);
    first.promises.push_back(std::move(promise));
    execute(state_, std::move(first), std::move(call_args));
    return future;
  }

  // Calls waiting for the next window.
  std::size_t queued() const {
    typename LockPolicy::lock_type lock(state_->mutex);
    if (auto *busy = std::get_if<busy_state>(&state_->phase))
      return busy->queued.inputs.size();
    return 0;
  }

private:
  // Calls settled together; inputs[i] belongs to promises[i].
  struct round {
    std::vector<args_tuple> inputs;
    std::vector<async_promise<R>> promises;
  };

  struct idle_state {};
  struct busy_state {
    round queued;
  };

  struct state {
    state(function_type f, batch_function b, unbatch_function u,
          batch_config c)
        : fn(std::move(f)), batch_fn(std::move(b)), unbatch(std::move(u)),
          config(c) {}

    function_type fn;
    const batch_function batch_fn;
    const unbatch_function unbatch;
    const batch_config config;
    typename LockPolicy::mutex_type mutex;
    std::variant<idle_state, busy_state> phase;
  };

  using state_ptr = std::shared_ptr<state>;

  static detached_task execute(state_ptr s, round r, args_tuple run_args) {
    auto window = std::make_shared<detail::interval_window>(
        s->config.disregard_execution_time);
    close_window_after(s, window,
                       std::chrono::steady_clock::now() + s->config.interval);

    auto result = co_await detail::invoke_captured(s->fn, std::move(run_args));
    settle_round(*s, r, std::move(result));

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

  // Starts the calls queued during the window, or goes idle when there are
  // none. A round whose merge fails is rejected on the spot and the next
  // arrivals are looked at again.
  static void schedule_next(const state_ptr &s) {
    while (true) {
      round next;
      {
        typename LockPolicy::lock_type lock(s->mutex);
        auto &busy = std::get<busy_state>(s->phase);
        if (busy.queued.promises.empty()) {
          s->phase = idle_state{};
          return;
        }
        std::swap(next, busy.queued);
      }

      if (next.promises.size() == 1) {
        args_tuple run_args = next.inputs.front();
        execute(s, std::move(next), std::move(run_args));
        return;
      }

      std::optional<args_tuple> merged;
      std::exception_ptr failure;
      try {
        merged.emplace(s->batch_fn(next.inputs));
      } catch (...) {
        failure = std::current_exception();
      }

      if (merged) {
        execute(s, std::move(next), std::move(*merged));
        return;
      }
      reject(next, failure);
    }
  }

  static void settle_round(const state &s, round &r, outcome<R> result) {
    if constexpr (!std::is_void_v<R>) {
      if (s.unbatch && r.promises.size() > 1 && !result.has_exception()) {
        std::vector<R> outputs;
        std::exception_ptr failure;
        try {
          outputs = s.unbatch(r.inputs, result.peek());
        } catch (...) {
          failure = std::current_exception();
        }

        if (!failure && outputs.size() != r.promises.size()) {
          failure = std::make_exception_ptr(std::length_error(
              "cosync: unbatch returned " + std::to_string(outputs.size()) +
              " outputs for " + std::to_string(r.promises.size()) +
              " inputs"));
        }
        if (failure) {
          reject(r, failure);
          return;
        }

        for (std::size_t i = 0; i < outputs.size(); ++i) {
          r.promises[i].set_value(std::move(outputs[i]));
        }
        return;
      }
    }

    for (auto &promise : r.promises) {
      promise.settle(result);
    }
  }

  static void reject(round &r, const std::exception_ptr &failure) {
    for (auto &promise : r.promises) {
      promise.set_exception(failure);
    }
  }

  state_ptr state_;
};

} // namespace cosync

#endif // COSYNC_COORD_BATCH_HPP
