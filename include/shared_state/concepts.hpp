#ifndef COSYNC_SHARED_STATE_CONCEPTS_HPP
#define COSYNC_SHARED_STATE_CONCEPTS_HPP

#include <concepts>
#include <type_traits>

namespace cosync {

template <typename T> class coro_task;

// =============================================================================
// Task Detection
// =============================================================================

template <typename T> struct is_coro_task : std::false_type {};

template <typename T> struct is_coro_task<coro_task<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_coro_task_v = is_coro_task<T>::value;

// =============================================================================
// Wrapped Operation Concepts
// =============================================================================

// A callable usable as the body of a coordination primitive: either an
// asynchronous function producing coro_task<R>, or a plain function whose
// result converts to R.
template <typename F, typename R, typename... Args>
concept AsyncCallable =
    std::invocable<F &, Args...> &&
    (std::same_as<std::invoke_result_t<F &, Args...>, coro_task<R>> ||
     (!is_coro_task_v<std::invoke_result_t<F &, Args...>> &&
      (std::is_void_v<R> ||
       std::convertible_to<std::invoke_result_t<F &, Args...>, R>)));

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename P>
concept LockingPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
} && BasicLockable<typename P::mutex_type>;

} // namespace cosync

#endif // COSYNC_SHARED_STATE_CONCEPTS_HPP
