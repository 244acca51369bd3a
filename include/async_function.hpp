#ifndef COSYNC_ASYNC_FUNCTION_HPP
#define COSYNC_ASYNC_FUNCTION_HPP

#include <exception>
#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

#include "coro_task.hpp"
#include "shared_state/concepts.hpp"
#include "shared_state/crtp_base.hpp"
#include "shared_state/future.hpp"

namespace cosync {

template <typename Signature> class async_function;

namespace detail {

// Runs a synchronous callable as the body of a task, so that its exceptions
// travel through the task's outcome like any asynchronous failure.
template <typename R, typename F, typename... Args>
coro_task<R> lift(std::shared_ptr<F> fn, Args... args) {
  if constexpr (std::is_void_v<R>) {
    std::invoke(*fn, std::move(args)...);
    co_return;
  } else {
    co_return std::invoke(*fn, std::move(args)...);
  }
}

} // namespace detail

// =============================================================================
// async_function<R(Args...)> - type-erased wrapped operation
// =============================================================================
//
// Holds either an asynchronous callable (returns coro_task<R>) or a plain one
// (returns something convertible to R). Copies share the callable.

template <typename R, typename... Args> class async_function<R(Args...)> {
public:
  using result_type = R;
  using args_tuple = std::tuple<Args...>;

  async_function() = default;

  template <typename F>
    requires(!std::same_as<std::remove_cvref_t<F>, async_function> &&
             AsyncCallable<std::decay_t<F>, R, Args...>)
  async_function(F &&f) {
    using callable = std::decay_t<F>;
    auto shared = std::make_shared<callable>(std::forward<F>(f));
    if constexpr (is_coro_task_v<std::invoke_result_t<callable &, Args...>>) {
      impl_ = std::make_shared<impl_type>(
          [shared](Args... args) -> coro_task<R> {
            return std::invoke(*shared, std::move(args)...);
          });
    } else {
      impl_ = std::make_shared<impl_type>(
          [shared](Args... args) -> coro_task<R> {
            return detail::lift<R>(shared, std::move(args)...);
          });
    }
  }

  explicit operator bool() const noexcept { return impl_ != nullptr; }

  coro_task<R> operator()(Args... args) const {
    return (*impl_)(std::move(args)...);
  }

  coro_task<R> apply(args_tuple args) const {
    return std::apply(
        [this](Args &...unpacked) {
          return (*impl_)(std::move(unpacked)...);
        },
        args);
  }

private:
  using impl_type = std::function<coro_task<R>(Args...)>;
  std::shared_ptr<impl_type> impl_;
};

namespace detail {

// Never throws: a failure to even create the task lands in the outcome.
template <typename R, typename... Args>
coro_task<outcome<R>> invoke_captured(async_function<R(Args...)> fn,
                                      std::tuple<Args...> args) {
  outcome<R> result;
  try {
    if constexpr (std::is_void_v<R>) {
      co_await fn.apply(std::move(args));
      result.set_value();
    } else {
      result.set_value(co_await fn.apply(std::move(args)));
    }
  } catch (...) {
    result.set_exception(std::current_exception());
  }
  co_return result;
}

// Runs `fn(args)` to completion and settles `promise` with the outcome.
template <typename R, typename... Args>
detached_task deliver(async_function<R(Args...)> fn, std::tuple<Args...> args,
                      async_promise<R> promise) {
  promise.settle(co_await invoke_captured(std::move(fn), std::move(args)));
}

} // namespace detail

} // namespace cosync

#endif // COSYNC_ASYNC_FUNCTION_HPP
