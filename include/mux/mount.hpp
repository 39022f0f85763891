#pragma once

#include "handler.hpp"

namespace mux {
    /// Serves requests under `prefix` by invoking `handler` with the
    /// prefix removed from the request path.
    ///
    /// A path equal to the prefix reaches `handler` as "/"; a path outside
    /// the prefix is answered with 404. The original path and parameter
    /// bindings are restored once `handler` returns or throws.
    auto strip_prefix(std::string_view prefix, handler_ptr handler) -> handler_ptr;
}
