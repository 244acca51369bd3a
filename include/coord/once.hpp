#ifndef COSYNC_COORD_ONCE_HPP
#define COSYNC_COORD_ONCE_HPP

#include <memory>
#include <optional>
#include <tuple>
#include <utility>

#include "async_function.hpp"
#include "shared_state/future.hpp"
#include "shared_state/policies.hpp"

namespace cosync {

template <typename Signature, typename LockPolicy = mutex_lock_policy>
class once;

// =============================================================================
// once<R(Args...)> - run the wrapped function at most one time, ever
// =============================================================================
//
// The first call starts fn with its own arguments; every call, before or after
// completion, gets a future onto that single outcome. A failure is cached like
// a value: there is no retry.

template <typename R, typename... Args, typename LockPolicy>
class once<R(Args...), LockPolicy> {
public:
  using function_type = async_function<R(Args...)>;

  explicit once(function_type fn)
      : state_(std::make_shared<state>(std::move(fn))) {}

  async_future<R> operator()(Args... args) const {
    typename LockPolicy::lock_type lock(state_->mutex);
    if (state_->future) {
      return *state_->future;
    }

    async_promise<R> promise;
    state_->future = promise.get_future();
    auto future = *state_->future;
    lock.unlock();

    detail::deliver(state_->fn, std::make_tuple(std::move(args)...),
                    std::move(promise));
    return future;
  }

  bool has_started() const {
    typename LockPolicy::lock_type lock(state_->mutex);
    return state_->future.has_value();
  }

private:
  struct state {
    explicit state(function_type f) : fn(std::move(f)) {}

    function_type fn;
    typename LockPolicy::mutex_type mutex;
    std::optional<async_future<R>> future;
  };

  std::shared_ptr<state> state_;
};

} // namespace cosync

#endif // COSYNC_COORD_ONCE_HPP
