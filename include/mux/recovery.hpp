#pragma once

#include "handler.hpp"

#include <exception>
#include <functional>
#include <string>

namespace mux {
    /// Called with the exception that escaped the wrapped handler.
    using recover_function = std::function<void(
        const request& req,
        response& res,
        std::exception_ptr ex
    )>;

    /// Middleware that stops exceptions thrown by the handlers it wraps
    /// from leaving the request.
    ///
    /// By default the fault is logged and, unless the response has been
    /// committed, answered with 500 Internal Server Error.
    class recovery {
        recover_function recover;
    public:
        recovery();

        /// An empty function selects the default behavior.
        explicit recovery(recover_function recover);

        auto operator()(handler_ptr next) const -> handler_ptr;
    };

    /// Describes `ex` and every exception nested inside it, outermost
    /// first.
    auto describe(std::exception_ptr ex) -> std::string;
}
