#ifndef COSYNC_COORD_RW_LOCK_HPP
#define COSYNC_COORD_RW_LOCK_HPP

#include <coroutine>
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include "shared_state/crtp_base.hpp"
#include "shared_state/policies.hpp"

namespace cosync {

// =============================================================================
// rw_lock<T> - many readers or one writer over a guarded value, FIFO fair
// =============================================================================
//
// Requests are granted strictly in arrival order. A request only skips the
// queue when the queue is empty, so a read arriving behind a waiting writer
// waits for that writer. Consecutive reads at the head of the queue are
// granted together.
//
// Each request can be awaited (co_await lock.read()) or, outside a coroutine,
// completed with get(), which blocks the calling thread.
//
// The lock must outlive every guard and pending request.

template <typename T, typename LockPolicy = mutex_lock_policy>
class rw_lock : public sync_primitive_base<rw_lock<T, LockPolicy>, LockPolicy> {
  using base_type = sync_primitive_base<rw_lock<T, LockPolicy>, LockPolicy>;
  using lock_type = typename base_type::lock_type;

  enum class access { read, write };

  struct lock_waiter {
    access kind;
    bool granted{false};
    std::coroutine_handle<> handle{nullptr};
  };

public:
  class read_guard;
  class write_guard;

  explicit rw_lock(T initial = T{}) : value_(std::move(initial)) {}

  // ---------------------------------------------------------------------------
  // Guards
  // ---------------------------------------------------------------------------

  class read_guard {
  public:
    read_guard(const read_guard &) = delete;
    read_guard &operator=(const read_guard &) = delete;

    read_guard(read_guard &&other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)) {}

    read_guard &operator=(read_guard &&other) noexcept {
      if (this != &other) {
        release();
        lock_ = std::exchange(other.lock_, nullptr);
      }
      return *this;
    }

    ~read_guard() { release(); }

    const T &operator*() const { return lock_->value_; }
    const T *operator->() const { return &lock_->value_; }

    bool owns_lock() const noexcept { return lock_ != nullptr; }

    void release() {
      if (auto *lock = std::exchange(lock_, nullptr))
        lock->release_read();
    }

  private:
    friend class rw_lock;
    explicit read_guard(rw_lock *lock) : lock_(lock) {}

    rw_lock *lock_;
  };

  class write_guard {
  public:
    write_guard(const write_guard &) = delete;
    write_guard &operator=(const write_guard &) = delete;

    write_guard(write_guard &&other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)) {}

    write_guard &operator=(write_guard &&other) noexcept {
      if (this != &other) {
        release();
        lock_ = std::exchange(other.lock_, nullptr);
      }
      return *this;
    }

    ~write_guard() { release(); }

    T &operator*() const { return lock_->value_; }
    T *operator->() const { return &lock_->value_; }

    bool owns_lock() const noexcept { return lock_ != nullptr; }

    void release() {
      if (auto *lock = std::exchange(lock_, nullptr))
        lock->release_write();
    }

    // Stores `value` as the new guarded value, then releases.
    void release(T value) {
      if (lock_) {
        lock_->value_ = std::move(value);
        release();
      }
    }

  private:
    friend class rw_lock;
    explicit write_guard(rw_lock *lock) : lock_(lock) {}

    rw_lock *lock_;
  };

  // ---------------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------------

  template <access Kind, typename Guard>
  class request : public awaitable_base<request<Kind, Guard>, Guard> {
  public:
    request(const request &) = delete;
    request &operator=(const request &) = delete;

    bool ready_impl() { return false; }

    bool suspend_impl(std::coroutine_handle<> h) {
      waiter_.handle = h;
      return lock_->enqueue(waiter_);
    }

    Guard resume_impl() { return lock_->template make_guard<Guard>(); }

    // Blocking acquire for non-coroutine contexts
    Guard get() {
      lock_->acquire_blocking(waiter_);
      return lock_->template make_guard<Guard>();
    }

  private:
    friend class rw_lock;
    explicit request(rw_lock *lock) : lock_(lock), waiter_{Kind} {}

    rw_lock *lock_;
    lock_waiter waiter_;
  };

  using read_request = request<access::read, read_guard>;
  using write_request = request<access::write, write_guard>;

  read_request read() { return read_request{this}; }
  write_request write() { return write_request{this}; }

  std::optional<read_guard> try_read() {
    lock_type lock(this->mutex_);
    if (!queue_.empty() || writer_active_)
      return std::nullopt;
    ++active_readers_;
    return read_guard{this};
  }

  std::optional<write_guard> try_write() {
    lock_type lock(this->mutex_);
    if (!queue_.empty() || writer_active_ || active_readers_ != 0)
      return std::nullopt;
    writer_active_ = true;
    return write_guard{this};
  }

  std::size_t readers() const {
    lock_type lock(this->mutex_);
    return active_readers_;
  }

  bool writer_active() const {
    lock_type lock(this->mutex_);
    return writer_active_;
  }

  std::size_t waiting() const {
    lock_type lock(this->mutex_);
    return queue_.size();
  }

private:
  template <typename Guard> Guard make_guard() { return Guard{this}; }

  bool compatible(access kind) const {
    if (kind == access::read)
      return !writer_active_;
    return !writer_active_ && active_readers_ == 0;
  }

  void grant(lock_waiter &waiter) {
    if (waiter.kind == access::read)
      ++active_readers_;
    else
      writer_active_ = true;
    waiter.granted = true;
  }

  // Returns false when granted on the spot (resume without suspending).
  bool enqueue(lock_waiter &waiter) {
    lock_type lock(this->mutex_);
    if (queue_.empty() && compatible(waiter.kind)) {
      grant(waiter);
      return false;
    }
    queue_.push_back(&waiter);
    return true;
  }

  void acquire_blocking(lock_waiter &waiter) {
    lock_type lock(this->mutex_);
    if (queue_.empty() && compatible(waiter.kind)) {
      grant(waiter);
      return;
    }
    queue_.push_back(&waiter);
    this->wait_for_condition(lock, [&waiter] { return waiter.granted; });
  }

  // Grants from the head of the queue while compatible. Handles are copied out
  // because a granted waiter may be destroyed as soon as the lock drops.
  void dispatch(std::vector<std::coroutine_handle<>> &to_resume,
                bool &wake_blocked) {
    while (!queue_.empty() && compatible(queue_.front()->kind)) {
      lock_waiter *waiter = queue_.front();
      queue_.pop_front();
      std::coroutine_handle<> handle = waiter->handle;
      grant(*waiter);
      if (handle)
        to_resume.push_back(handle);
      else
        wake_blocked = true;
    }
  }

  void release_read() { release(access::read); }
  void release_write() { release(access::write); }

  void release(access kind) {
    std::vector<std::coroutine_handle<>> to_resume;
    bool wake_blocked = false;
    {
      lock_type lock(this->mutex_);
      if (kind == access::read)
        --active_readers_;
      else
        writer_active_ = false;
      dispatch(to_resume, wake_blocked);
    }

    if (wake_blocked)
      this->notify_all();
    for (auto handle : to_resume)
      schedule_coro_handle(handle);
  }

  T value_;
  std::size_t active_readers_{0};
  bool writer_active_{false};
  std::deque<lock_waiter *> queue_;
};

} // namespace cosync

#endif // COSYNC_COORD_RW_LOCK_HPP
