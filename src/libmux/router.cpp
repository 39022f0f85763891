#include <mux/router.hpp>

#include <timber/timber>

using namespace std::literals;

namespace mux {
    auto router::insert(std::string_view text, handler_ptr handler) -> void {
        if (!handler) {
            throw configuration_error("pattern '{}' has no handler", text);
        }

        const auto pattern = pattern::parse(text);

        try {
            paths.insert(pattern).use(
                pattern.method,
                {std::move(handler), pattern.params()}
            );
        }
        catch (const configuration_error& ex) {
            throw configuration_error(
                "pattern '{}' conflicts with an existing route: {}",
                text,
                ex.what()
            );
        }

        TIMBER_TRACE("Registered pattern '{}'", text);
    }

    auto router::handle(request& req, response& res) const -> void {
        TIMBER_TRACE("{}", req);

        auto captures = capture_list();
        const method_router* matched = nullptr;
        const method_router::route* target = nullptr;

        paths.find(req.path, captures, [&](const method_router& methods) {
            if (!matched) matched = &methods;
            target = methods.find(req.method);
            return target != nullptr;
        });

        if (!target) {
            if (matched) {
                res.status = 405;
                res.headers.insert_or_assign(
                    "allow",
                    std::string(matched->allowed())
                );
                res.send("Method Not Allowed"sv);
            }
            else {
                res.status = 404;
                res.send("Not Found"sv);
            }

            return;
        }

        for (std::size_t i = 0; i < captures.size(); ++i) {
            req.params.insert_or_assign(target->params[i], captures[i]);
        }

        try {
            target->handler->handle(req, res);
        }
        catch (const error_code& error) {
            TIMBER_DEBUG(
                "{} {}, Status: {} ({})",
                req.method,
                req.path,
                error.code(),
                error.what()
            );

            res.status = error.code();
            res.send(error.what());
        }
    }

    auto router::to_string() const -> std::string {
        return paths.to_string();
    }
}
