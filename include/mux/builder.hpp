#pragma once

#include "handler.hpp"

#include <fmt/format.h>
#include <string>
#include <vector>

#define MUX_METHOD(name, str) \
    template <typename F> \
    auto name(std::string_view path, F&& f) -> builder& { \
        return handle(fmt::format("{} {}", str, path), std::forward<F>(f)); \
    } \
\
    template <typename T, typename F> \
    auto name(std::string_view path, T& t, F&& f) -> builder& { \
        return handle(fmt::format("{} {}", str, path), t, std::forward<F>(f)); \
    }

namespace mux {
    /// Collects routes, mounts and middleware, then combines them into a
    /// single handler.
    ///
    /// Registration only records its arguments; patterns are validated by
    /// `finalize`. A builder can be finalized once. The handler it returns
    /// is built from a snapshot of the builder's state, so anything added
    /// afterwards has no effect on it.
    class builder {
        struct route {
            std::string pattern;
            handler_ptr handler;
        };

        std::vector<route> routes;
        std::vector<route> mounts;
        std::vector<middleware> middlewares;
        bool finalized = false;
    public:
        /// Registers `handler` for requests matching `pattern`.
        auto handle(std::string_view pattern, handler_ptr handler) -> builder&;

        template <typename F>
        requires (!std::convertible_to<F, handler_ptr>)
        auto handle(std::string_view pattern, F&& f) -> builder& {
            return handle(pattern, make_handler(std::forward<F>(f)));
        }

        template <typename T, typename F>
        auto handle(std::string_view pattern, T& t, F&& f) -> builder& {
            return handle(pattern, make_handler(t, std::forward<F>(f)));
        }

        /// Delegates every request under `prefix` to `handler`, with the
        /// prefix, less any trailing slash, removed from the request path.
        auto mount(std::string_view prefix, handler_ptr handler) -> builder&;

        /// Appends a middleware. The first one added is the outermost and
        /// sees each request first. A middleware must return a handler.
        auto use(middleware mw) -> builder&;

        /// Registers every route and mount into a new router and wraps it
        /// in the middleware stack.
        ///
        /// Throws configuration_error if a pattern or prefix is malformed
        /// or collides with another, or if called a second time.
        auto finalize() -> handler_ptr;

        MUX_METHOD(del,   "DELETE")
        MUX_METHOD(get,   "GET")
        MUX_METHOD(head,  "HEAD")
        MUX_METHOD(patch, "PATCH")
        MUX_METHOD(post,  "POST")
        MUX_METHOD(put,   "PUT")
    };
}

#undef MUX_METHOD
