#pragma once

#include "handler.hpp"

#include <fmt/core.h>
#include <functional>

namespace mux {
    /// Receives one log record as a format string and its arguments.
    using log_function = std::function<void(
        fmt::string_view format,
        fmt::format_args args
    )>;

    /// Middleware that logs the status, method, path and duration of each
    /// request once the handlers it wraps have returned.
    ///
    /// Records go to timber at info level unless another function is given.
    /// A request that ends in an exception is not logged; place a recovery
    /// middleware inside this one to log faulted requests.
    class access_log {
        log_function log;
    public:
        access_log();

        /// An empty function selects the default destination.
        explicit access_log(log_function log);

        auto operator()(handler_ptr next) const -> handler_ptr;
    };
}
