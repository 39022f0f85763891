#pragma once

#include "pattern.hpp"

#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mux {
    /// Values bound to parameter segments, in pattern order.
    using capture_list = std::vector<std::string_view>;

    /// Segment trie keyed by parsed patterns.
    ///
    /// Each node stands for the path consumed so far. `value` holds what
    /// was registered for exactly that path, `subtree` what was registered
    /// for the path followed by a trailing slash. Literal children are kept
    /// ahead of the parameter child, which is kept ahead of the catch-all,
    /// so the first match found is the most specific one.
    template <typename T>
    class node {
        segment_type type = segment_type::literal;
        std::string name;
        std::optional<T> value;
        std::optional<T> subtree;
        std::vector<node> children;

        node(segment_type type, std::string_view name) :
            type(type),
            name(name)
        {}

        auto child(const segment& seg) -> node& {
            auto it = children.begin();

            for (; it != children.end(); ++it) {
                if (it->type == segment_type::literal) {
                    if (
                        seg.type == segment_type::literal &&
                        it->name == seg.value
                    ) return *it;

                    continue;
                }

                if (it->type == seg.type) return *it;

                if (seg.type == segment_type::literal) break;
                if (
                    seg.type == segment_type::param &&
                    it->type == segment_type::catch_all
                ) break;
            }

            const auto name = seg.type == segment_type::literal ?
                std::string_view(seg.value) : std::string_view();

            return *children.insert(it, node(seg.type, name));
        }

        template <typename Accept>
        static auto try_slot(
            const std::optional<T>& slot,
            Accept& accept
        ) -> const T* {
            if (slot && accept(*slot)) return &*slot;
            return nullptr;
        }

        template <typename Accept>
        auto find(
            std::string_view path,
            std::size_t pos,
            capture_list& captures,
            Accept& accept
        ) const -> const T* {
            if (pos == path.size()) {
                if (const auto* result = try_slot(value, accept)) {
                    return result;
                }

                return try_slot(subtree, accept);
            }

            const auto start = pos + 1;
            const auto slash = path.find('/', start);
            const auto end = slash == std::string_view::npos ?
                path.size() : slash;
            const auto seg = path.substr(start, end - start);

            for (const auto& child : children) {
                switch (child.type) {
                    case segment_type::literal:
                        if (seg != child.name) continue;
                        if (const auto* result =
                            child.find(path, end, captures, accept)
                        ) return result;
                        break;
                    case segment_type::param: {
                        if (seg.empty()) continue;

                        captures.push_back(seg);
                        if (const auto* result =
                            child.find(path, end, captures, accept)
                        ) return result;
                        captures.pop_back();
                        break;
                    }
                    case segment_type::catch_all:
                        captures.push_back(path.substr(start));
                        if (const auto* result =
                            try_slot(child.value, accept)
                        ) return result;
                        captures.pop_back();
                        break;
                }
            }

            return try_slot(subtree, accept);
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            int level
        ) const -> void {
            const auto indent = level * 2;
            for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

            switch (type) {
                case segment_type::literal:
                    fmt::format_to(out, "/{}", name);
                    break;
                case segment_type::param:
                    fmt::format_to(out, "/{{}}");
                    break;
                case segment_type::catch_all:
                    fmt::format_to(out, "/{{...}}");
                    break;
            }

            if (value) fmt::format_to(out, " [{}]", *value);
            if (subtree) fmt::format_to(out, " /... [{}]", *subtree);
            fmt::format_to(out, "\n");

            for (const auto& child : children) child.format_to(out, level + 1);
        }
    public:
        node() = default;

        /// Returns the slot for `pattern`, creating it empty if needed.
        /// Parameter segments are unnamed here; patterns that differ only
        /// in parameter names share a slot.
        auto insert(const pattern& pattern) -> T& {
            auto* current = this;

            for (const auto& seg : pattern.segments) {
                current = &current->child(seg);
            }

            auto& slot = pattern.subtree ? current->subtree : current->value;
            if (!slot) slot.emplace();
            return *slot;
        }

        /// Finds the most specific entry matching `path` for which
        /// `accept` returns true. The values of the parameter segments
        /// crossed on the way are appended to `captures`.
        template <typename Accept>
        auto find(
            std::string_view path,
            capture_list& captures,
            Accept&& accept
        ) const -> const T* {
            if (!path.empty() && !path.starts_with('/')) return nullptr;
            return find(path, 0, captures, accept);
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            if (value) fmt::format_to(out, "[{}]", *value);
            if (subtree) fmt::format_to(out, "/... [{}]", *subtree);
            fmt::format_to(out, "\n");

            for (const auto& child : children) child.format_to(out, 0);

            return fmt::to_string(buffer);
        }
    };
}
