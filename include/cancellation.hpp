#ifndef COSYNC_CANCELLATION_HPP
#define COSYNC_CANCELLATION_HPP

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>

namespace cosync {

// Exception thrown when a cancelled operation is detected
struct cancelled_exception : std::exception {
  const char *what() const noexcept override { return "operation cancelled"; }
};

enum class cancel_status { running, cancelled };

using epoch_type = std::uint64_t;

// Invoked with (cancelled round, newest round).
using cancel_callback = std::function<void(epoch_type, epoch_type)>;

// =============================================================================
// Cancellation State - one per serial wrapper
// =============================================================================
//
// A monotonically increasing epoch. Starting a round bumps it, which cancels
// every round started before.

class cancellation_state {
public:
  explicit cancellation_state(cancel_callback on_cancel = {})
      : on_cancel_(std::move(on_cancel)) {}

  epoch_type begin_round() {
    return epoch_.fetch_add(1, std::memory_order_acq_rel) + 1;
  }

  epoch_type latest() const { return epoch_.load(std::memory_order_acquire); }

  bool is_superseded(epoch_type round) const { return latest() != round; }

  void notify_cancelled(epoch_type round, epoch_type newest) const {
    if (on_cancel_)
      on_cancel_(round, newest);
  }

private:
  std::atomic<epoch_type> epoch_{0};
  cancel_callback on_cancel_;
};

// =============================================================================
// Cancel Token - handed to one round of a serial function
// =============================================================================

class cancel_token {
public:
  cancel_token(std::shared_ptr<const cancellation_state> state,
               epoch_type epoch)
      : state_(std::move(state)), round_(std::make_shared<round>(epoch)) {}

  epoch_type epoch() const noexcept { return round_->epoch; }

  epoch_type latest_epoch() const { return state_->latest(); }

  // Pure query, never fires the callback.
  bool is_cancelled() const { return state_->is_superseded(round_->epoch); }

  // Fires the cancel callback the first time a newer round is observed.
  cancel_status check_cancel() const {
    epoch_type newest = state_->latest();
    if (newest == round_->epoch)
      return cancel_status::running;

    if (!round_->notified.exchange(true, std::memory_order_acq_rel))
      state_->notify_cancelled(round_->epoch, newest);
    return cancel_status::cancelled;
  }

  void throw_if_cancelled() const {
    if (check_cancel() == cancel_status::cancelled)
      throw cancelled_exception{};
  }

private:
  struct round {
    explicit round(epoch_type e) : epoch(e) {}
    const epoch_type epoch;
    std::atomic<bool> notified{false};
  };

  std::shared_ptr<const cancellation_state> state_;
  // Shared by every copy of the token given out for the same round
  std::shared_ptr<round> round_;
};

} // namespace cosync

#endif // COSYNC_CANCELLATION_HPP
