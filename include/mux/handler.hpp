#pragma once

#include "request.hpp"
#include "response.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mux {
    /// The single request-processing capability. Endpoint handlers,
    /// mounted routers and middleware-wrapped handlers all implement it.
    ///
    /// `handle` may be called concurrently for different requests.
    struct handler {
        virtual ~handler() = default;

        virtual auto handle(request& req, response& res) const -> void = 0;
    };

    using handler_ptr = std::shared_ptr<const handler>;

    /// Wraps one handler in another to add behavior around it.
    using middleware = std::function<handler_ptr(handler_ptr)>;

    /// What an endpoint function may return besides void: a status code,
    /// or text to send as the body.
    template <typename T>
    concept reply =
        std::same_as<std::remove_cvref_t<T>, int> ||
        std::convertible_to<T, std::string_view>;

    namespace detail {
        template <typename F>
        auto call(const F& f, request& req, response& res) -> decltype(auto) {
            if constexpr (std::invocable<const F&, request&, response&>) {
                return std::invoke(f, req, res);
            }
            else if constexpr (std::invocable<const F&, request&>) {
                return std::invoke(f, req);
            }
            else if constexpr (std::invocable<const F&, response&>) {
                return std::invoke(f, res);
            }
            else {
                static_assert(
                    std::invocable<const F&>,
                    "an endpoint takes (request&, response&), (request&), "
                    "(response&) or no arguments"
                );

                return std::invoke(f);
            }
        }

        template <typename F>
        class endpoint final : public handler {
            using result = decltype(
                call(std::declval<const F&>(), std::declval<request&>(),
                    std::declval<response&>())
            );

            static_assert(
                std::is_void_v<result> || reply<result>,
                "an endpoint returns void, an int status or text"
            );

            F fn;
        public:
            explicit endpoint(F&& fn) : fn(std::move(fn)) {}

            auto handle(request& req, response& res) const -> void override {
                if constexpr (std::is_void_v<result>) call(fn, req, res);
                else if constexpr (std::same_as<std::remove_cvref_t<result>, int>) {
                    res.status = call(fn, req, res);
                }
                else {
                    const auto& text = call(fn, req, res);
                    res.send(std::string_view(text));
                }
            }
        };
    }

    template <typename F>
    requires (!std::convertible_to<F, handler_ptr>)
    auto make_handler(F&& f) -> handler_ptr {
        using type = std::decay_t<F>;
        return std::make_shared<detail::endpoint<type>>(
            type(std::forward<F>(f))
        );
    }

    template <typename T, typename R, typename... Args>
    auto make_handler(T& t, R (T::*fn)(Args...)) -> handler_ptr {
        return make_handler([&t, fn](Args... args) -> R {
            return (t.*fn)(std::forward<Args>(args)...);
        });
    }

    template <typename T, typename R, typename... Args>
    auto make_handler(const T& t, R (T::*fn)(Args...) const) -> handler_ptr {
        return make_handler([&t, fn](Args... args) -> R {
            return (t.*fn)(std::forward<Args>(args)...);
        });
    }
}
