#ifndef COSYNC_DIAGNOSTICS_HPP
#define COSYNC_DIAGNOSTICS_HPP

#include <exception>
#include <functional>

namespace cosync {

using unhandled_exception_handler = std::function<void(std::exception_ptr)>;

// Installs the sink for exceptions that escape scheduled work and have no
// caller left to observe them. Passing an empty handler restores the default,
// which writes a single line to std::cerr. Returns the previous handler.
unhandled_exception_handler
set_unhandled_exception_handler(unhandled_exception_handler handler);

void report_unhandled_exception(std::exception_ptr e) noexcept;

} // namespace cosync

#endif // COSYNC_DIAGNOSTICS_HPP
