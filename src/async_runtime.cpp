#include <atomic>
#include <mutex>
#include <stdexcept>

#include "async_runtime.hpp"

namespace cosync {

namespace {

std::mutex config_mutex;
runtime_config pending_config;
bool runtime_started = false;

// Set for the lifetime of the runtime; handles scheduled while it is being
// torn down (or after) run inline.
std::atomic<task_scheduler *> active_scheduler{nullptr};
std::atomic<bool> runtime_destroyed{false};

} // namespace

async_runtime::async_runtime(runtime_config config)
    : scheduler_(scheduler_config{config.worker_count}), timers_(scheduler_) {}

async_runtime::~async_runtime() {
  shutdown();
  task_scheduler *self = &scheduler_;
  if (active_scheduler.compare_exchange_strong(self, nullptr,
                                               std::memory_order_acq_rel)) {
    runtime_destroyed.store(true, std::memory_order_release);
  }
}

void async_runtime::shutdown() {
  timers_.shutdown();
  scheduler_.shutdown();
}

void configure_runtime(runtime_config config) {
  std::lock_guard<std::mutex> lock(config_mutex);
  if (runtime_started) {
    throw std::logic_error(
        "cosync: configure_runtime called after the runtime started");
  }
  pending_config = config;
}

async_runtime &get_runtime() {
  static async_runtime &instance = [] () -> async_runtime & {
    runtime_config config;
    {
      std::lock_guard<std::mutex> lock(config_mutex);
      runtime_started = true;
      config = pending_config;
    }
    static async_runtime runtime(config);
    active_scheduler.store(&runtime.scheduler(), std::memory_order_release);
    return runtime;
  }();
  return instance;
}

timer_service &get_timer_service() { return get_runtime().timers(); }

void schedule_coro_handle(std::coroutine_handle<> handle) {
  if (auto *scheduler = active_scheduler.load(std::memory_order_acquire)) {
    scheduler->schedule_coro_handle(handle);
    return;
  }
  if (runtime_destroyed.load(std::memory_order_acquire)) {
    // Static destruction is over; nothing left to hand the work to.
    if (handle && !handle.done())
      handle.resume();
    return;
  }
  get_runtime().scheduler().schedule_coro_handle(handle);
}

} // namespace cosync
