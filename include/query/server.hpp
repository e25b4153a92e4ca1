#pragma once

#include <query/route.hpp>

#include <memory>
#include <timber/timber>

namespace query {
    namespace detail {
        template <typename F, typename Tuple>
        struct handles : std::false_type {};

        template <typename F, typename... Args>
        struct handles<F, std::tuple<Args...>> :
            std::is_invocable<F&, Args&&...> {};

        template <typename F, typename Tuple>
        struct handler_result {};

        template <typename F, typename... Args>
        struct handler_result<F, std::tuple<Args...>> {
            using type = std::invoke_result_t<F&, Args&&...>;
        };

        template <typename Handler, typename... Args>
        auto serve(
            const endpoint&,
            const parsed_query&,
            Handler& handler,
            std::tuple<Args...>&& args
        ) -> decltype(auto) {
            return std::apply(handler, std::move(args));
        }

        template <
            server_interpretable C,
            typename Next,
            typename Handler,
            typename... Args
        >
        auto serve(
            const node<C, Next>& route,
            const parsed_query& query,
            Handler& handler,
            std::tuple<Args...>&& args
        ) -> decltype(auto) {
            using value_type = typename C::server_type;

            return route.combinator.serve(
                query,
                [&](value_type value) -> decltype(auto) {
                    return detail::serve(
                        route.next,
                        query,
                        handler,
                        std::tuple_cat(
                            std::move(args),
                            std::tuple<value_type>(std::move(value))
                        )
                    );
                }
            );
        }
    }

    template <typename F, typename R>
    concept handler_for =
        route<R> &&
        detail::handles<std::remove_cvref_t<F>, server_types_t<R>>::value;

    template <typename F, route R>
    requires handler_for<F, R>
    using handler_result_t = typename detail::handler_result<
        std::remove_cvref_t<F>,
        server_types_t<R>
    >::type;

    template <route R, typename F>
    requires handler_for<F, R>
    auto serve(const R& route, const parsed_query& query, F&& handler)
        -> decltype(auto)
    {
        return detail::serve(route, query, handler, std::tuple<>());
    }

    template <route R, typename F>
    requires handler_for<F, R>
    auto serve(const R& route, std::string_view raw_query, F&& handler) {
        const auto parsed = parse(raw_query);
        return query::serve(route, parsed, std::forward<F>(handler));
    }

    // A handler whose parameter types are hidden behind a virtual call.
    template <typename R>
    struct handler {
        virtual ~handler() = default;

        virtual auto handle(const parsed_query& query) -> R = 0;

        auto operator()(std::string_view raw_query) -> R {
            return handle(parse(raw_query));
        }
    };

    namespace detail {
        template <typename Route, typename F>
        class route_handler :
            public query::handler<handler_result_t<F, Route>>
        {
            using result_type = handler_result_t<F, Route>;

            const Route route;
            F fn;
        public:
            route_handler(const Route& route, F&& fn) :
                route(route),
                fn(std::forward<F>(fn))
            {}

            auto handle(const parsed_query& parsed) -> result_type override {
                TIMBER_TRACE(
                    "Handling '{}' with {} query parameters",
                    endpoint_of(route).name,
                    parsed.size()
                );

                return query::serve(route, parsed, fn);
            }
        };
    }

    template <route R, typename F>
    requires handler_for<F, R>
    auto make_handler(const R& route, F&& f)
        -> std::unique_ptr<handler<handler_result_t<F, R>>>
    {
        using function = std::decay_t<F>;

        return std::unique_ptr<handler<handler_result_t<F, R>>>(
            new detail::route_handler<R, function>(
                route,
                function(std::forward<F>(f))
            )
        );
    }
}
