#pragma once

#include <query/route.hpp>

namespace query {
    namespace detail {
        template <typename Types, typename Args>
        struct accepts : std::false_type {};

        template <typename... Types, typename... Args>
        requires (sizeof...(Types) == sizeof...(Args))
        struct accepts<std::tuple<Types...>, std::tuple<Args...>> :
            std::bool_constant<(std::is_constructible_v<Types, Args> && ...)>
        {};

        auto build(const endpoint& route, request&& req) -> request;

        template <
            client_interpretable C,
            typename Next,
            typename First,
            typename... Rest
        >
        auto build(
            const node<C, Next>& route,
            request&& req,
            First&& first,
            Rest&&... rest
        ) -> request {
            const auto value = typename C::client_type(
                std::forward<First>(first)
            );

            return route.combinator.client(
                std::move(req),
                value,
                [&](request&& next) -> request {
                    return detail::build(
                        route.next,
                        std::move(next),
                        std::forward<Rest>(rest)...
                    );
                }
            );
        }
    }

    template <typename R, typename... Args>
    concept arguments_for =
        route<R> &&
        detail::accepts<client_types_t<R>, std::tuple<Args...>>::value;

    template <route R, typename... Args>
    requires arguments_for<R, Args...>
    auto build(const R& route, request&& req, Args&&... args) -> request {
        return detail::build(
            route,
            std::move(req),
            std::forward<Args>(args)...
        );
    }

    class client final {
        const query::url base_url;
    public:
        client(std::string_view base_url);

        template <route R, typename... Args>
        requires arguments_for<R, Args...>
        auto request(const R& route, Args&&... args) const -> query::request {
            return query::build(
                route,
                query::request("GET", base_url),
                std::forward<Args>(args)...
            );
        }

        auto url() const noexcept -> const query::url&;
    };
}
