#ifndef COSYNC_SHARED_STATE_FUTURE_HPP
#define COSYNC_SHARED_STATE_FUTURE_HPP

#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include "crtp_base.hpp"
#include "policies.hpp"

namespace cosync {

// Raised to every consumer of a future whose promise was dropped unsettled.
struct broken_promise : std::exception {
  const char *what() const noexcept override {
    return "promise destroyed before it was settled";
  }
};

// =============================================================================
// Future State - one outcome, any number of blocking or suspended consumers
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class future_state
    : public sync_primitive_base<future_state<T, LockPolicy>, LockPolicy>,
      public async_primitive_base<future_state<T, LockPolicy>> {
  using base_type =
      sync_primitive_base<future_state<T, LockPolicy>, LockPolicy>;

  outcome<T> result_;
  bool ready_{false};

public:
  future_state() = default;

  // Returns false if the state was already settled; the outcome is dropped.
  bool settle(outcome<T> result) {
    {
      typename base_type::lock_type lock(this->mutex_);
      if (ready_) {
        return false;
      }
      result_ = std::move(result);
      ready_ = true;
    }
    this->notify_all();
    this->wake_all();
    return true;
  }

  bool is_ready() const {
    typename base_type::lock_type lock(this->mutex_);
    return ready_;
  }

  const outcome<T> &wait() const {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock, [this] { return ready_; });
    return result_;
  }

  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    typename base_type::lock_type lock(this->mutex_);
    return this->wait_for_condition_for(lock, [this] { return ready_; },
                                        timeout);
  }

  // Parks `node` unless the outcome is already there.
  bool park_if_pending(waiter_node *node) {
    typename base_type::lock_type lock(this->mutex_);
    if (ready_) {
      return false;
    }
    this->add_waiter(node);
    return true;
  }

  // Only meaningful once ready; the outcome is immutable afterwards.
  const outcome<T> &result() const { return result_; }
};

// =============================================================================
// Future Awaiter
// =============================================================================

template <typename T>
class future_awaiter : public awaitable_base<future_awaiter<T>, T> {
  std::shared_ptr<future_state<T>> state_;
  waiter_node node_;

public:
  explicit future_awaiter(std::shared_ptr<future_state<T>> state)
      : state_(std::move(state)), node_(nullptr) {}

  bool ready_impl() { return state_->is_ready(); }

  bool suspend_impl(std::coroutine_handle<> h) {
    node_.handle = h;
    return state_->park_if_pending(&node_);
  }

  T resume_impl() { return state_->result().peek(); }
};

template <typename T> class async_promise;

// =============================================================================
// Async Future - shared, copyable view of a pending outcome
// =============================================================================
//
// Every copy observes the same outcome: a copy of the value, or the very same
// exception object.

template <typename T> class async_future {
public:
  using value_type = T;

  async_future() = default;

  bool valid() const noexcept { return state_ != nullptr; }

  bool is_ready() const { return state_ && state_->is_ready(); }

  void wait() const { state_->wait(); }

  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    return state_->wait_for(timeout);
  }

  // Blocking get for non-coroutine contexts
  T get() const { return state_->wait().peek(); }

  future_awaiter<T> operator co_await() const {
    return future_awaiter<T>{state_};
  }

  bool shares_state_with(const async_future &other) const noexcept {
    return state_ == other.state_;
  }

private:
  friend class async_promise<T>;

  explicit async_future(std::shared_ptr<future_state<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<future_state<T>> state_;
};

// =============================================================================
// Async Promise - producing end, settled exactly once
// =============================================================================

template <typename T> class async_promise {
public:
  async_promise() : state_(std::make_shared<future_state<T>>()) {}

  async_promise(const async_promise &) = delete;
  async_promise &operator=(const async_promise &) = delete;

  async_promise(async_promise &&other) noexcept
      : state_(std::exchange(other.state_, nullptr)) {}

  async_promise &operator=(async_promise &&other) noexcept {
    if (this != &other) {
      abandon();
      state_ = std::exchange(other.state_, nullptr);
    }
    return *this;
  }

  ~async_promise() { abandon(); }

  async_future<T> get_future() const { return async_future<T>{state_}; }

  void settle(outcome<T> result) {
    if (!state_ || !state_->settle(std::move(result))) {
      throw std::logic_error("cosync: promise already satisfied");
    }
  }

  template <typename U>
    requires std::constructible_from<T, U &&>
  void set_value(U &&value) {
    outcome<T> result;
    result.set_value(T(std::forward<U>(value)));
    settle(std::move(result));
  }

  void set_value()
    requires std::is_void_v<T>
  {
    outcome<T> result;
    result.set_value();
    settle(std::move(result));
  }

  void set_exception(std::exception_ptr e) {
    outcome<T> result;
    result.set_exception(std::move(e));
    settle(std::move(result));
  }

  bool is_settled() const { return state_ && state_->is_ready(); }

private:
  void abandon() noexcept {
    if (state_ && !state_->is_ready()) {
      outcome<T> result;
      result.set_exception(std::make_exception_ptr(broken_promise{}));
      state_->settle(std::move(result));
    }
    state_.reset();
  }

  std::shared_ptr<future_state<T>> state_;
};

} // namespace cosync

#endif // COSYNC_SHARED_STATE_FUTURE_HPP
