#include <mux/access_log.hpp>

#include <chrono>
#include <fmt/chrono.h>
#include <timber/timber>

namespace {
    auto log_default(fmt::string_view format, fmt::format_args args) -> void {
        TIMBER_INFO("{}", fmt::vformat(format, args));
    }

    class access_log_handler final : public mux::handler {
        mux::handler_ptr next;
        mux::log_function log;
    public:
        access_log_handler(
            mux::handler_ptr&& next,
            const mux::log_function& log
        ) :
            next(std::move(next)),
            log(log)
        {}

        auto handle(
            mux::request& req,
            mux::response& res
        ) const -> void override {
            const auto start = std::chrono::steady_clock::now();

            next->handle(req, res);

            const auto elapsed =
                std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - start
                );

            log(
                "{} {} {} {}",
                fmt::make_format_args(
                    res.status,
                    req.method,
                    req.path,
                    elapsed
                )
            );
        }
    };
}

namespace mux {
    access_log::access_log() : access_log(nullptr) {}

    access_log::access_log(log_function log) : log(std::move(log)) {
        if (!this->log) this->log = log_default;
    }

    auto access_log::operator()(handler_ptr next) const -> handler_ptr {
        return std::make_shared<access_log_handler>(std::move(next), log);
    }
}
