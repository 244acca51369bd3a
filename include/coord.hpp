#ifndef COSYNC_COORD_HPP
#define COSYNC_COORD_HPP

// Umbrella header: the runtime plus every coordination primitive.

#include "async_function.hpp"
#include "async_runtime.hpp"
#include "cancellation.hpp"
#include "coro_task.hpp"
#include "diagnostics.hpp"
#include "shared_state/future.hpp"
#include "shared_state/policies.hpp"
#include "sleep.hpp"

#include "coord/batch.hpp"
#include "coord/debounce.hpp"
#include "coord/latest.hpp"
#include "coord/once.hpp"
#include "coord/rw_lock.hpp"
#include "coord/serial.hpp"

#endif // COSYNC_COORD_HPP
