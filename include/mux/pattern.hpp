#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>

namespace mux {
    enum class segment_type {
        literal,
        param,
        catch_all
    };

    struct segment {
        segment_type type;
        std::string value;

        auto operator==(const segment& other) const -> bool = default;
    };

    /// A parsed route pattern: `[METHOD ]/path/{param}/{rest...}`.
    ///
    /// A trailing slash makes the pattern match the whole subtree below
    /// its path. `{$}` as the final segment instead anchors the match at
    /// the trailing slash; it is stored as an empty literal segment.
    struct pattern {
        std::string text;
        std::string method;
        std::vector<segment> segments;
        bool subtree = false;

        /// Throws configuration_error if `text` is not a valid pattern.
        static auto parse(std::string_view text) -> pattern;

        /// Names of the parameter and catch-all segments, in order.
        auto params() const -> std::vector<std::string>;

        /// Path part of the pattern, without the method.
        auto path() const -> std::string_view;
    };
}

template <>
struct fmt::formatter<mux::pattern> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const mux::pattern& pattern, FormatContext& ctx) const {
        return formatter<std::string_view>::format(pattern.text, ctx);
    }
};
