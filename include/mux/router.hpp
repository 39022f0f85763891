#pragma once

#include "method_router.hpp"
#include "node.hpp"

#include <fmt/format.h>

namespace mux {
    using path = node<method_router>;

    /// Dispatches requests to the handlers registered for matching
    /// patterns. Populated once, then read-only and safe to share between
    /// concurrent requests.
    ///
    /// A request whose path matches no pattern is answered with 404; one
    /// whose path matches but whose method does not, with 405 and an Allow
    /// header. An `error_code` thrown by a handler becomes the response
    /// status. Any other exception propagates to the caller.
    class router final : public handler {
        path paths;
    public:
        /// Throws configuration_error if the pattern is malformed or
        /// collides with one registered earlier.
        auto insert(std::string_view pattern, handler_ptr handler) -> void;

        auto handle(request& req, response& res) const -> void override;

        auto to_string() const -> std::string;
    };
}

template <>
struct fmt::formatter<mux::request> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const mux::request& request, FormatContext& ctx) const {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        fmt::format_to(out, "{} {}", request.method, request.path);

        if (!request.query.empty()) {
            fmt::format_to(out, "\nQuery ({}):", request.query.size());

            for (const auto& entry : request.query) {
                fmt::format_to(out, "\n\t{} = {}", entry.first, entry.second);
            }
        }

        if (!request.headers.empty()) {
            fmt::format_to(out, "\nHeaders ({}):", request.headers.size());

            for (const auto& entry : request.headers) {
                fmt::format_to(out, "\n\t{}: {}", entry.first, entry.second);
            }
        }

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
