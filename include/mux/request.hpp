#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace mux {
    /// One inbound request as handed over by the host.
    ///
    /// `path` and the keys and values of `params` and `query` are views;
    /// the host (see `mux::exchange`) owns the storage and keeps it alive
    /// for the duration of the call. Parameter names point into the
    /// router's immutable pattern table.
    struct request {
        using param_map = std::unordered_map<std::string_view, std::string_view>;

        std::string method;
        std::string_view path;
        param_map params;
        param_map query;
        std::unordered_map<std::string, std::string> headers;
        std::string body;
    };
}
