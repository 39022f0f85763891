#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mux {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    /// Raised while a router is being assembled: a malformed, duplicate or
    /// conflicting pattern, or a builder that was already finalized.
    class configuration_error : public error {
    public:
        using error::error;
    };

    /// Thrown by a handler to answer the request with an HTTP error status.
    class error_code : public error {
        int errorc;
    public:
        error_code(int code, std::string_view what) :
            error(what),
            errorc(code)
        {}

        template <typename... T>
        error_code(int code, fmt::format_string<T...> format, T&&... args) :
            error(format, std::forward<T>(args)...),
            errorc(code)
        {}

        auto code() const noexcept -> int {
            return errorc;
        }
    };
}
