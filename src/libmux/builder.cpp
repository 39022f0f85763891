#include <mux/builder.hpp>
#include <mux/mount.hpp>
#include <mux/router.hpp>

#include <timber/timber>

namespace {
    auto stripped(std::string_view prefix) -> std::string_view {
        if (prefix.ends_with('/')) prefix.remove_suffix(1);
        return prefix;
    }

    auto validate_mount(std::string_view prefix) -> void {
        const auto pattern = mux::pattern::parse(prefix);

        if (!pattern.method.empty()) {
            throw mux::configuration_error(
                "mount prefix '{}' must not name a method",
                prefix
            );
        }

        if (prefix.find_first_of("{}") != std::string_view::npos) {
            throw mux::configuration_error(
                "mount prefix '{}' must be a literal path",
                prefix
            );
        }
    }
}

namespace mux {
    auto builder::handle(
        std::string_view pattern,
        handler_ptr handler
    ) -> builder& {
        routes.push_back({std::string(pattern), std::move(handler)});
        return *this;
    }

    auto builder::mount(
        std::string_view prefix,
        handler_ptr handler
    ) -> builder& {
        mounts.push_back({std::string(prefix), std::move(handler)});
        return *this;
    }

    auto builder::use(middleware mw) -> builder& {
        middlewares.push_back(std::move(mw));
        return *this;
    }

    auto builder::finalize() -> handler_ptr {
        if (finalized) {
            throw configuration_error("router has already been finalized");
        }

        finalized = true;

        auto router = std::make_shared<mux::router>();

        for (const auto& route : routes) {
            router->insert(route.pattern, route.handler);
        }

        for (const auto& mount : mounts) {
            validate_mount(mount.pattern);

            if (!mount.handler) {
                throw configuration_error(
                    "mount prefix '{}' has no handler",
                    mount.pattern
                );
            }

            router->insert(
                mount.pattern,
                strip_prefix(stripped(mount.pattern), mount.handler)
            );
        }

        TIMBER_DEBUG(
            "Router finalized with {} route{}, {} mount{} "
            "and {} middleware{}\n{}",
            routes.size(),
            routes.size() == 1 ? "" : "s",
            mounts.size(),
            mounts.size() == 1 ? "" : "s",
            middlewares.size(),
            middlewares.size() == 1 ? "" : "s",
            router->to_string()
        );

        auto result = handler_ptr(std::move(router));

        for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
            result = (*it)(std::move(result));
        }

        routes.clear();
        mounts.clear();
        middlewares.clear();

        return result;
    }
}
