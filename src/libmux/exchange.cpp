#include <mux/exchange.hpp>

#include <cctype>
#include <cstdint>
#include <ext/string.h>
#include <timber/timber>

namespace {
    auto hex_to_uint(char c) -> std::uint8_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;

        return 0;
    }

    auto percent_decode(
        std::string_view value,
        char* buffer,
        std::size_t& pos,
        bool plus_as_space
    ) -> std::string_view {
        const auto start = pos;
        std::size_t i = 0;

        while (i < value.size()) {
            const auto c = value[i];

            if (
                c == '%' &&
                i + 2 < value.size() &&
                std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(value[i + 2]))
            ) {
                buffer[pos++] = static_cast<char>(
                    (hex_to_uint(value[i + 1]) << 4) +
                    hex_to_uint(value[i + 2])
                );
                i += 3;
                continue;
            }

            buffer[pos++] = plus_as_space && c == '+' ? ' ' : c;
            ++i;
        }

        return {buffer + start, pos - start};
    }
}

namespace mux {
    exchange::exchange(std::string_view method, std::string_view target) {
        request.method = method;
        process_target(target);
    }

    auto exchange::dispatch(const handler& handler) -> mux::response& {
        handler.handle(request, response);
        return response;
    }

    auto exchange::header(
        std::string_view name,
        std::string_view value
    ) -> exchange& {
        TIMBER_TRACE("Received header '{}: {}'", name, value);

        auto key = std::string(name);
        for (auto& c : key) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        request.headers.insert_or_assign(std::move(key), std::string(value));
        return *this;
    }

    auto exchange::process_target(std::string_view target) -> void {
        auto storage = std::unique_ptr<char[]>(new char[target.size() + 1]);

        auto* const buffer = storage.get();
        std::size_t pos = 0;

        auto query = std::string_view();
        const auto query_start = target.find('?');
        if (query_start != std::string_view::npos) {
            query = target.substr(query_start + 1);
            target = target.substr(0, query_start);
        }

        request.path = percent_decode(target, buffer, pos, false);

        if (!query.empty()) process_query(query, buffer, pos);

        target_storage = std::move(storage);
    }

    auto exchange::process_query(
        std::string_view query,
        char* buffer,
        std::size_t pos
    ) -> void {
        for (const auto entry : ext::string_range(query, "&")) {
            if (entry.empty()) continue;

            const auto delim = entry.find('=');

            if (delim == std::string_view::npos) {
                request.query.insert_or_assign(
                    percent_decode(entry, buffer, pos, true),
                    std::string_view()
                );
                continue;
            }

            const auto key = percent_decode(
                entry.substr(0, delim),
                buffer,
                pos,
                true
            );
            const auto value = percent_decode(
                entry.substr(delim + 1),
                buffer,
                pos,
                true
            );

            request.query.insert_or_assign(key, value);
        }
    }
}
