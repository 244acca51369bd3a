#ifndef COSYNC_COORD_LATEST_HPP
#define COSYNC_COORD_LATEST_HPP

#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "async_function.hpp"
#include "coro_task.hpp"
#include "shared_state/future.hpp"
#include "shared_state/policies.hpp"

namespace cosync {

template <typename Signature, typename LockPolicy = mutex_lock_policy>
class latest;

// =============================================================================
// latest<R(Args...)> - every caller gets the result of the last round
// =============================================================================
//
// While a round runs, new calls do not start fn. Their arguments are folded
// into one pending round by update_args; when the running round finishes the
// pending one starts immediately, and so on until nothing is pending. Only then
// is every caller of the whole busy period settled, all with the outcome of the
// final round.
//
// are_args_equal(proposed, current) == true drops the pending round: the
// caller shares the round already in flight.

template <typename R, typename... Args, typename LockPolicy>
class latest<R(Args...), LockPolicy> {
public:
  using function_type = async_function<R(Args...)>;
  using args_tuple = std::tuple<Args...>;

  using equality_function =
      std::function<bool(const args_tuple &proposed, const args_tuple &current)>;

  // (running round, arrivals earlier in this round, newest arrival,
  //  pending round if any) -> arguments of the pending round
  using update_function = std::function<args_tuple(
      const args_tuple &current, const std::vector<args_tuple> &middle,
      const args_tuple &newest, const std::optional<args_tuple> &next)>;

  explicit latest(function_type fn, equality_function are_args_equal = {},
                  update_function update_args = {})
      : state_(std::make_shared<state>(std::move(fn), std::move(are_args_equal),
                                       std::move(update_args))) {}

  async_future<R> operator()(Args... args) const {
    args_tuple call_args(std::move(args)...);
    async_promise<R> promise;
    auto future = promise.get_future();

    typename LockPolicy::lock_type lock(state_->mutex);
    if (auto *busy = std::get_if<busy_state>(&state_->phase)) {
      args_tuple proposed =
          state_->update_args
              ? state_->update_args(busy->current, busy->middle, call_args,
                                    busy->next)
              : call_args;

      if (state_->are_args_equal &&
          state_->are_args_equal(proposed, busy->current)) {
        busy->next.reset();
      } else {
        busy->next = std::move(proposed);
      }
      busy->middle.push_back(std::move(call_args));
      busy->waiters.push_back(std::move(promise));
      return future;
    }

    busy_state busy{call_args};
    busy.waiters.push_back(std::move(promise));
    state_->phase = std::move(busy);
    lock.unlock();

    drive(state_, std::move(call_args));
    return future;
  }

  bool is_idle() const {
    typename LockPolicy::lock_type lock(state_->mutex);
    return std::holds_alternative<idle_state>(state_->phase);
  }

private:
  struct idle_state {};
  struct busy_state {
    explicit busy_state(args_tuple c) : current(std::move(c)) {}

    args_tuple current;
    std::optional<args_tuple> next;
    std::vector<args_tuple> middle;
    std::vector<async_promise<R>> waiters;
  };

  struct state {
    state(function_type f, equality_function eq, update_function up)
        : fn(std::move(f)), are_args_equal(std::move(eq)),
          update_args(std::move(up)) {}

    function_type fn;
    const equality_function are_args_equal;
    const update_function update_args;
    typename LockPolicy::mutex_type mutex;
    std::variant<idle_state, busy_state> phase;
  };

  using state_ptr = std::shared_ptr<state>;

  static detached_task drive(state_ptr s, args_tuple args) {
    while (true) {
      auto result = co_await detail::invoke_captured(s->fn, std::move(args));

      std::vector<async_promise<R>> waiters;
      {
        typename LockPolicy::lock_type lock(s->mutex);
        auto &busy = std::get<busy_state>(s->phase);
        if (busy.next) {
          args = std::move(*busy.next);
          busy.next.reset();
          busy.middle.clear();
          busy.current = args;
          continue;
        }
        waiters = std::move(busy.waiters);
        s->phase = idle_state{};
      }

      for (auto &waiter : waiters) {
        waiter.settle(result);
      }
      co_return;
    }
  }

  state_ptr state_;
};

} // namespace cosync

#endif // COSYNC_COORD_LATEST_HPP
