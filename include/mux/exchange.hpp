#pragma once

#include "handler.hpp"

#include <fmt/format.h>
#include <memory>

namespace mux {
    /// One request and its response, as a host would hold them while the
    /// request is handled.
    ///
    /// The request target is split into a percent-decoded path and query
    /// parameters whose storage the exchange owns.
    class exchange {
        std::unique_ptr<char[]> target_storage;

        auto process_target(std::string_view target) -> void;

        auto process_query(
            std::string_view query,
            char* buffer,
            std::size_t pos
        ) -> void;
    public:
        mux::request request;
        mux::response response;

        exchange(std::string_view method, std::string_view target);

        exchange(const exchange&) = delete;

        exchange(exchange&&) = delete;

        auto operator=(const exchange&) -> exchange& = delete;

        auto operator=(exchange&&) -> exchange& = delete;

        auto header(std::string_view name, std::string_view value) -> exchange&;

        /// Runs `handler` for this exchange and returns the response.
        auto dispatch(const handler& handler) -> mux::response&;
    };
}
