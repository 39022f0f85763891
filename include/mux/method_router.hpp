#pragma once

#include "error.hpp"
#include "handler.hpp"

#include <fmt/format.h>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mux {
    /// Handlers registered for one path, keyed by method. The empty method
    /// stands for a pattern without a method, which accepts any method.
    class method_router {
    public:
        /// A registered handler together with the names its pattern gives
        /// to the parameter segments, in order.
        struct route {
            handler_ptr handler;
            std::vector<std::string> params;
        };
    private:
        std::string allowed_cache;
        std::map<std::string, route, std::less<>> methods;
    public:
        /// Lists the methods this path answers, for the Allow header.
        auto allowed() const noexcept -> std::string_view;

        auto find(std::string_view method) const -> const route*;

        /// Throws configuration_error if `method` already has a handler.
        auto use(std::string_view method, route&& entry) -> void;
    };
}

template <>
struct fmt::formatter<mux::method_router> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const mux::method_router& router, FormatContext& ctx) const {
        return formatter<std::string_view>::format(router.allowed(), ctx);
    }
};
