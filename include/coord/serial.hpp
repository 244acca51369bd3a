#ifndef COSYNC_COORD_SERIAL_HPP
#define COSYNC_COORD_SERIAL_HPP

#include <memory>
#include <optional>
#include <tuple>
#include <utility>

#include "async_function.hpp"
#include "cancellation.hpp"
#include "coro_task.hpp"
#include "shared_state/future.hpp"

namespace cosync {

enum class serial_status { completed, cancelled };

// =============================================================================
// serial_result<T> - value of a round, or notice that it was superseded
// =============================================================================

template <typename T> class serial_result {
public:
  using value_type = T;

  serial_result(T value) : value_(std::move(value)) {}

  static serial_result cancelled() { return serial_result{}; }

  serial_status status() const noexcept {
    return value_ ? serial_status::completed : serial_status::cancelled;
  }

  bool is_cancelled() const noexcept { return !value_.has_value(); }

  explicit operator bool() const noexcept { return value_.has_value(); }

  // Throws cancelled_exception for a superseded round.
  const T &value() const & {
    if (!value_)
      throw cancelled_exception{};
    return *value_;
  }

  T value() && {
    if (!value_)
      throw cancelled_exception{};
    return std::move(*value_);
  }

  bool operator==(const serial_result &) const = default;

private:
  serial_result() = default;

  std::optional<T> value_;
};

template <> class serial_result<void> {
public:
  using value_type = void;

  serial_result() = default;

  static serial_result cancelled() {
    serial_result r;
    r.status_ = serial_status::cancelled;
    return r;
  }

  serial_status status() const noexcept { return status_; }

  bool is_cancelled() const noexcept {
    return status_ == serial_status::cancelled;
  }

  explicit operator bool() const noexcept { return !is_cancelled(); }

  void value() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  bool operator==(const serial_result &) const = default;

private:
  serial_status status_{serial_status::completed};
};

template <typename Signature> class serial;

// =============================================================================
// serial<R(Args...)> - every call runs, newer calls supersede older ones
// =============================================================================
//
// fn receives a cancel_token as its first argument. Each call bumps the epoch
// and starts fn right away; a round that observes a newer epoch, through its
// own polling or the check made once fn returns, resolves to
// serial_result::cancelled() and any exception it threw is dropped. on_cancel
// fires at most once per superseded round, with (that round, newest round).
// No lock policy: the only shared state is the atomic epoch.

template <typename R, typename... Args> class serial<R(Args...)> {
public:
  using function_type = async_function<R(cancel_token, Args...)>;
  using result_type = serial_result<R>;

  explicit serial(function_type fn, cancel_callback on_cancel = {})
      : fn_(std::move(fn)),
        cancellation_(
            std::make_shared<cancellation_state>(std::move(on_cancel))) {}

  async_future<result_type> operator()(Args... args) const {
    cancel_token token(cancellation_, cancellation_->begin_round());

    async_promise<result_type> promise;
    auto future = promise.get_future();
    run(fn_, token,
        std::tuple<cancel_token, Args...>(token, std::move(args)...),
        std::move(promise));
    return future;
  }

  // Epoch of the newest round; 0 before the first call.
  epoch_type current_epoch() const { return cancellation_->latest(); }

private:
  static detached_task run(function_type fn, cancel_token token,
                           std::tuple<cancel_token, Args...> args,
                           async_promise<result_type> promise) {
    auto result = co_await detail::invoke_captured(fn, std::move(args));

    if (token.check_cancel() == cancel_status::cancelled) {
      promise.set_value(result_type::cancelled());
    } else if (result.has_exception()) {
      promise.set_exception(result.exception());
    } else if constexpr (std::is_void_v<R>) {
      promise.set_value(result_type{});
    } else {
      promise.set_value(result_type{result.get()});
    }
  }

  function_type fn_;
  std::shared_ptr<cancellation_state> cancellation_;
};

} // namespace cosync

#endif // COSYNC_COORD_SERIAL_HPP
