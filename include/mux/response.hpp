#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mux::media {
    inline constexpr auto utf8_text = std::string_view(
        "text/plain; charset=utf-8"
    );
}

namespace mux {
    struct response {
        int status = 200;
        std::unordered_map<std::string, std::string> headers;
        std::string body;

        /// Set by the host once the status line and headers have been
        /// handed to the transport. After that point `status` and
        /// `headers` no longer reach the client.
        bool committed = false;

        auto content_length(std::size_t length) -> void {
            headers.insert_or_assign("content-length", std::to_string(length));
        }

        auto content_type(std::string_view type) -> void {
            headers.insert_or_assign("content-type", std::string(type));
        }

        /// Drops any status, headers and body written so far.
        auto reset() -> void {
            status = 200;
            headers.clear();
            body.clear();
        }

        /// Replaces the body with plain text.
        auto send(std::string_view text) -> void {
            body = text;
            content_type(media::utf8_text);
            content_length(body.size());
        }
    };
}
