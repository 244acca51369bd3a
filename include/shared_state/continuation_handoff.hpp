#ifndef COSYNC_SHARED_STATE_CONTINUATION_HANDOFF_HPP
#define COSYNC_SHARED_STATE_CONTINUATION_HANDOFF_HPP

#include <atomic>
#include <coroutine>
#include <cstdint>

namespace cosync {

// One-shot rendezvous between a finishing coroutine and the coroutine that
// awaits it. Whichever side arrives second owns the resumption.
//
// Single word of state:
//   bit 0      producer finished
//   bits 1..n  address of the waiting coroutine (frames are at least
//              2-byte aligned, so bit 0 of the address is always clear)
class continuation_handoff {
public:
  continuation_handoff() = default;
  continuation_handoff(const continuation_handoff &) = delete;
  continuation_handoff &operator=(const continuation_handoff &) = delete;

  // Producer side. True when a continuation is already parked and the
  // producer must resume it.
  bool signal_ready() noexcept {
    std::uintptr_t prev = word_.fetch_or(ready_bit, std::memory_order_acq_rel);
    return (prev & address_mask) != 0;
  }

  // Consumer side. Returns `awaiting` when the producer already finished (the
  // consumer resumes itself), otherwise noop_coroutine().
  std::coroutine_handle<> offer(std::coroutine_handle<> awaiting) noexcept {
    auto addr = reinterpret_cast<std::uintptr_t>(awaiting.address());
    std::uintptr_t prev = word_.fetch_or(addr, std::memory_order_acq_rel);
    if (prev & ready_bit) {
      return awaiting;
    }
    return std::noop_coroutine();
  }

  std::coroutine_handle<> continuation() const noexcept {
    auto addr = word_.load(std::memory_order_acquire) & address_mask;
    if (addr == 0) {
      return std::noop_coroutine();
    }
    return std::coroutine_handle<>::from_address(reinterpret_cast<void *>(addr));
  }

  bool is_ready() const noexcept {
    return (word_.load(std::memory_order_acquire) & ready_bit) != 0;
  }

private:
  static constexpr std::uintptr_t ready_bit = 1;
  static constexpr std::uintptr_t address_mask = ~ready_bit;

  std::atomic<std::uintptr_t> word_{0};
};

} // namespace cosync

#endif // COSYNC_SHARED_STATE_CONTINUATION_HANDOFF_HPP
