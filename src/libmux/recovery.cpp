#include <mux/error.hpp>
#include <mux/recovery.hpp>

#include <fmt/format.h>
#include <timber/timber>

using namespace std::literals;

namespace {
    auto recover_default(
        const mux::request& req,
        mux::response& res,
        std::exception_ptr ex
    ) -> void {
        TIMBER_ERROR(
            "{} {}: unhandled exception{}: {}",
            req.method,
            req.path,
            res.committed ? " after the response was committed" : "",
            mux::describe(ex)
        );

        if (res.committed) return;

        res.reset();
        res.status = 500;
        res.send("Internal Server Error"sv);
    }

    class recovery_handler final : public mux::handler {
        mux::handler_ptr next;
        mux::recover_function recover;
    public:
        recovery_handler(
            mux::handler_ptr&& next,
            const mux::recover_function& recover
        ) :
            next(std::move(next)),
            recover(recover)
        {}

        auto handle(
            mux::request& req,
            mux::response& res
        ) const -> void override {
            try {
                next->handle(req, res);
            }
            catch (const mux::error_code& error) {
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
            catch (...) {
                recover(req, res, std::current_exception());
            }
        }
    };
}

namespace mux {
    recovery::recovery() : recovery(nullptr) {}

    recovery::recovery(recover_function recover) :
        recover(std::move(recover))
    {
        if (!this->recover) this->recover = recover_default;
    }

    auto recovery::operator()(handler_ptr next) const -> handler_ptr {
        return std::make_shared<recovery_handler>(std::move(next), recover);
    }

    auto describe(std::exception_ptr ex) -> std::string {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        while (ex) {
            if (buffer.size() > 0) fmt::format_to(out, "\n    caused by: ");

            try {
                std::rethrow_exception(ex);
            }
            catch (const std::exception& e) {
                fmt::format_to(out, "{}", e.what());

                try {
                    std::rethrow_if_nested(e);
                    ex = nullptr;
                }
                catch (...) {
                    ex = std::current_exception();
                }
            }
            catch (...) {
                fmt::format_to(out, "unknown exception");
                ex = nullptr;
            }
        }

        return fmt::to_string(buffer);
    }
}
