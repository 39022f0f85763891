#include <mux/mount.hpp>

#include <ext/scope>
#include <timber/timber>

using namespace std::literals;

namespace {
    class prefix_handler final : public mux::handler {
        std::string prefix;
        mux::handler_ptr inner;
    public:
        prefix_handler(std::string_view prefix, mux::handler_ptr&& inner) :
            prefix(prefix),
            inner(std::move(inner))
        {}

        auto handle(
            mux::request& req,
            mux::response& res
        ) const -> void override {
            auto rest = std::string_view();

            if (req.path.starts_with(prefix)) {
                rest = req.path.substr(prefix.size());
                if (rest.empty()) rest = "/"sv;
            }

            if (!rest.starts_with('/')) {
                TIMBER_DEBUG(
                    "Path '{}' is outside the mount point '{}'",
                    req.path,
                    prefix
                );

                res.status = 404;
                res.send("Not Found"sv);
                return;
            }

            const auto path = req.path;
            auto params = req.params;
            const auto deferred = ext::scope_exit([&] {
                req.path = path;
                req.params = std::move(params);
            });

            req.path = rest;

            inner->handle(req, res);
        }
    };
}

namespace mux {
    auto strip_prefix(
        std::string_view prefix,
        handler_ptr handler
    ) -> handler_ptr {
        return std::make_shared<prefix_handler>(prefix, std::move(handler));
    }
}
