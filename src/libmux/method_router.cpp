#include <mux/method_router.hpp>

#include <algorithm>
#include <fmt/ranges.h>
#include <vector>

using namespace std::literals;

namespace mux {
    auto method_router::allowed() const noexcept -> std::string_view {
        return allowed_cache;
    }

    auto method_router::find(
        std::string_view method
    ) const -> const route* {
        auto result = methods.find(method);

        if (result == methods.end() && method == "HEAD") {
            result = methods.find("GET"sv);
        }

        if (result == methods.end()) result = methods.find(""sv);
        if (result == methods.end()) return nullptr;

        return &result->second;
    }

    auto method_router::use(std::string_view method, route&& entry) -> void {
        const auto [it, inserted] = methods.try_emplace(
            std::string(method),
            std::move(entry)
        );

        if (!inserted) {
            if (method.empty()) {
                throw configuration_error("a handler for all methods exists");
            }

            throw configuration_error("a {} handler exists", method);
        }

        auto list = std::vector<std::string_view>();

        if (methods.contains(""sv)) list.push_back("*");
        else {
            for (const auto& entry : methods) list.push_back(entry.first);

            if (methods.contains("GET"sv) && !methods.contains("HEAD"sv)) {
                list.push_back("HEAD");
                std::sort(list.begin(), list.end());
            }
        }

        allowed_cache = fmt::format("{}", fmt::join(list, ", "));
    }
}
