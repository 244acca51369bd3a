#ifndef COSYNC_SHARED_STATE_CRTP_BASE_HPP
#define COSYNC_SHARED_STATE_CRTP_BASE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"

namespace cosync {

// Forward declaration for scheduler integration
void schedule_coro_handle(std::coroutine_handle<> handle);

// =============================================================================
// Waiter Node for Async Primitives (Intrusive Linked List)
// =============================================================================

struct waiter_node {
  std::coroutine_handle<> handle{nullptr};
  waiter_node *next{nullptr};

  explicit waiter_node(std::coroutine_handle<> h) : handle(h), next(nullptr) {}
};

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
  requires LockingPolicy<LockPolicy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  mutable std::condition_variable_any cv_;

  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) const {
    cv_.wait(lock, pred);
  }

  template <typename Predicate, typename Rep, typename Period>
  bool wait_for_condition_for(lock_type &lock, Predicate pred,
                              std::chrono::duration<Rep, Period> timeout) const {
    return cv_.wait_for(lock, timeout, pred);
  }

  void notify_all() const { cv_.notify_all(); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Async Primitive Base - Provides waiter list management
// =============================================================================
//
// Callers that need "check then park" semantics must push under the same lock
// that publishes the condition, otherwise a wake_all() can slip in between.

template <typename Derived> class async_primitive_base {
protected:
  std::atomic<waiter_node *> waiters_{nullptr};

  void add_waiter(waiter_node *node) {
    waiter_node *old_head = waiters_.load(std::memory_order_acquire);
    do {
      node->next = old_head;
    } while (!waiters_.compare_exchange_weak(old_head, node,
                                             std::memory_order_release,
                                             std::memory_order_acquire));
  }

  // Detach the whole list first; a resumed waiter may free its node.
  void wake_all() {
    waiter_node *head = waiters_.exchange(nullptr, std::memory_order_acq_rel);
    while (head != nullptr) {
      waiter_node *next = head->next;
      if (head->handle) {
        schedule_coro_handle(head->handle);
      }
      head = next;
    }
  }

public:
  async_primitive_base() = default;
  ~async_primitive_base() = default;

  async_primitive_base(const async_primitive_base &) = delete;
  async_primitive_base &operator=(const async_primitive_base &) = delete;
  async_primitive_base(async_primitive_base &&) = delete;
  async_primitive_base &operator=(async_primitive_base &&) = delete;
};

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl()
  // - bool suspend_impl(std::coroutine_handle<> h)  (false = resume now)
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

// =============================================================================
// Outcome - value or exception of one finished unit of work
// =============================================================================

template <typename T> class outcome {
  std::optional<T> value_;
  std::exception_ptr exception_;

public:
  using value_type = T;

  void set_value(T value) { value_ = std::move(value); }

  void set_exception(std::exception_ptr e) { exception_ = std::move(e); }

  bool has_value() const noexcept { return value_.has_value(); }

  bool has_exception() const noexcept { return exception_ != nullptr; }

  std::exception_ptr exception() const noexcept { return exception_; }

  T get() {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
    return std::move(*value_);
  }

  const T &peek() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
    return *value_;
  }
};

template <> class outcome<void> {
  bool completed_{false};
  std::exception_ptr exception_;

public:
  using value_type = void;

  void set_value() { completed_ = true; }

  void set_exception(std::exception_ptr e) { exception_ = std::move(e); }

  bool has_value() const noexcept { return completed_; }

  bool has_exception() const noexcept { return exception_ != nullptr; }

  std::exception_ptr exception() const noexcept { return exception_; }

  void get() {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

  void peek() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }
};

} // namespace cosync

#endif // COSYNC_SHARED_STATE_CRTP_BASE_HPP
