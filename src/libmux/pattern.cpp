#include <mux/error.hpp>
#include <mux/pattern.hpp>

#include <algorithm>
#include <cctype>

using namespace std::literals;

namespace {
    constexpr auto token_symbols = "!#$%&'*+-.^_`|~"sv;
    constexpr auto whitespace = " \t"sv;

    auto is_token(std::string_view string) -> bool {
        if (string.empty()) return false;

        for (const auto c : string) {
            if (
                !std::isalnum(static_cast<unsigned char>(c)) &&
                token_symbols.find(c) == std::string_view::npos
            ) return false;
        }

        return true;
    }

    auto is_identifier(std::string_view string) -> bool {
        if (string.empty()) return false;

        const auto first = static_cast<unsigned char>(string.front());
        if (!std::isalpha(first) && first != '_') return false;

        for (const auto c : string.substr(1)) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                return false;
            }
        }

        return true;
    }
}

namespace mux {
    auto pattern::parse(std::string_view text) -> pattern {
        auto result = pattern();
        result.text = text;

        if (text.empty()) throw configuration_error("empty pattern");

        auto path = text;

        const auto space = text.find_first_of(whitespace);
        if (space != std::string_view::npos) {
            const auto method = text.substr(0, space);

            if (!is_token(method)) {
                throw configuration_error(
                    "invalid method '{}' in pattern '{}'",
                    method,
                    text
                );
            }

            result.method = method;

            path = text.substr(space);
            path.remove_prefix(
                std::min(path.find_first_not_of(whitespace), path.size())
            );
        }

        if (!path.starts_with('/')) {
            throw configuration_error(
                "pattern '{}': path must begin with '/'",
                text
            );
        }

        path.remove_prefix(1);

        auto names = std::vector<std::string_view>();
        std::size_t pos = 0;

        while (true) {
            const auto slash = path.find('/', pos);
            const auto last = slash == std::string_view::npos;
            const auto seg = last ?
                path.substr(pos) : path.substr(pos, slash - pos);

            if (seg.empty()) {
                if (last) {
                    result.subtree = true;
                    break;
                }

                throw configuration_error(
                    "pattern '{}' contains an empty segment",
                    text
                );
            }

            if (seg.front() != '{') {
                if (seg.find_first_of("{}") != std::string_view::npos) {
                    throw configuration_error(
                        "pattern '{}': wildcard '{}' must be "
                        "a full path segment",
                        text,
                        seg
                    );
                }

                result.segments.push_back({
                    segment_type::literal,
                    std::string(seg)
                });
            }
            else {
                if (seg.size() < 2 || seg.back() != '}') {
                    throw configuration_error(
                        "pattern '{}': unbalanced braces in segment '{}'",
                        text,
                        seg
                    );
                }

                auto name = seg.substr(1, seg.size() - 2);
                auto type = segment_type::param;

                if (name == "$") {
                    if (!last) {
                        throw configuration_error(
                            "pattern '{}': {{$}} must be the final segment",
                            text
                        );
                    }

                    result.segments.push_back({segment_type::literal, ""});
                    break;
                }

                if (name.ends_with("...")) {
                    name.remove_suffix(3);
                    type = segment_type::catch_all;

                    if (!last) {
                        throw configuration_error(
                            "pattern '{}': '{}' must be the final segment",
                            text,
                            seg
                        );
                    }
                }

                if (!is_identifier(name)) {
                    throw configuration_error(
                        "pattern '{}': invalid parameter name '{}'",
                        text,
                        name
                    );
                }

                for (const auto existing : names) {
                    if (existing == name) {
                        throw configuration_error(
                            "pattern '{}': duplicate parameter name '{}'",
                            text,
                            name
                        );
                    }
                }

                names.push_back(name);
                result.segments.push_back({type, std::string(name)});
            }

            if (last) break;
            pos = slash + 1;
        }

        return result;
    }

    auto pattern::params() const -> std::vector<std::string> {
        auto result = std::vector<std::string>();

        for (const auto& seg : segments) {
            if (seg.type != segment_type::literal) result.push_back(seg.value);
        }

        return result;
    }

    auto pattern::path() const -> std::string_view {
        const auto text = std::string_view(this->text);
        return text.substr(text.find('/'));
    }
}
