#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

#include "diagnostics.hpp"

namespace cosync {

namespace {

std::mutex handler_mutex;
unhandled_exception_handler handler;

void default_handler(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    std::cerr << "cosync: unhandled exception: " << ex.what() << std::endl;
  } catch (...) {
    std::cerr << "cosync: unhandled exception: <non-standard exception>"
              << std::endl;
  }
}

} // namespace

unhandled_exception_handler
set_unhandled_exception_handler(unhandled_exception_handler next) {
  std::lock_guard<std::mutex> lock(handler_mutex);
  return std::exchange(handler, std::move(next));
}

void report_unhandled_exception(std::exception_ptr e) noexcept {
  if (!e)
    return;

  unhandled_exception_handler current;
  {
    std::lock_guard<std::mutex> lock(handler_mutex);
    current = handler;
  }

  try {
    if (current) {
      current(e);
    } else {
      default_handler(e);
    }
  } catch (const std::exception &ex) {
    std::cerr << "cosync: exception handler threw: " << ex.what()
              << std::endl;
  } catch (...) {
    std::cerr << "cosync: exception handler threw: <non-standard exception>"
              << std::endl;
  }
}

} // namespace cosync
