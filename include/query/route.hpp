#pragma once

#include <query/docs.hpp>
#include <query/parsed_query.hpp>
#include <query/request.h>

#include <concepts>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace query {
    struct endpoint {
        std::string name;
        std::string description;

        endpoint() = default;

        explicit endpoint(
            std::string_view name,
            std::string_view description = {}
        );
    };

    template <typename Combinator, typename Next>
    struct node {
        Combinator combinator;
        Next next;
    };

    // Marks the end of a chain that has no endpoint yet.
    struct unterminated {};

    namespace detail {
        template <typename T>
        struct server_next {
            auto operator()(T) const -> int { return 0; }
        };

        struct client_next {
            auto operator()(request&& req) const -> request {
                return std::move(req);
            }
        };

        struct docs_next {
            auto operator()(docs::action&& action) const -> docs::action {
                return std::move(action);
            }
        };
    }

    template <typename C>
    concept server_interpretable = requires(
        const C& c,
        const parsed_query& query,
        detail::server_next<typename C::server_type> next
    ) {
        { c.serve(query, next) } -> std::same_as<int>;
    };

    template <typename C>
    concept client_interpretable = requires(
        const C& c,
        request&& req,
        const typename C::client_type& value,
        detail::client_next next
    ) {
        { c.client(std::move(req), value, next) } -> std::same_as<request>;
    };

    template <typename C>
    concept docs_interpretable = requires(
        const C& c,
        docs::action&& action,
        detail::docs_next next
    ) {
        { c.document(std::move(action), next) } ->
            std::same_as<docs::action>;
    };

    template <typename C>
    concept combinator =
        server_interpretable<C> ||
        client_interpretable<C> ||
        docs_interpretable<C>;

    namespace detail {
        template <typename T>
        struct is_route : std::false_type {};

        template <>
        struct is_route<endpoint> : std::true_type {};

        template <typename C, typename Next>
        struct is_route<node<C, Next>> : is_route<Next> {};

        template <typename T>
        concept link =
            combinator<std::remove_cvref_t<T>> ||
            std::same_as<std::remove_cvref_t<T>, endpoint>;

        template <link Link>
        auto append(unterminated, Link&& link) {
            using type = std::remove_cvref_t<Link>;

            if constexpr (std::same_as<type, endpoint>) {
                return type(std::forward<Link>(link));
            }
            else {
                return node<type, unterminated> {
                    .combinator = std::forward<Link>(link),
                    .next = {}
                };
            }
        }

        template <typename C, typename Next, link Link>
        auto append(node<C, Next>&& chain, Link&& link) {
            auto next = detail::append(
                std::move(chain.next),
                std::forward<Link>(link)
            );

            return node<C, decltype(next)> {
                .combinator = std::move(chain.combinator),
                .next = std::move(next)
            };
        }
    }

    template <typename T>
    concept route = detail::is_route<std::remove_cvref_t<T>>::value;

    template <combinator C, detail::link Link>
    auto operator>>(C first, Link&& second) {
        return detail::append(
            node<C, unterminated> {
                .combinator = std::move(first),
                .next = {}
            },
            std::forward<Link>(second)
        );
    }

    template <typename C, typename Next, detail::link Link>
    requires (!route<node<C, Next>>)
    auto operator>>(node<C, Next> chain, Link&& link) {
        return detail::append(std::move(chain), std::forward<Link>(link));
    }

    inline auto endpoint_of(const endpoint& route) noexcept
        -> const endpoint&
    {
        return route;
    }

    template <typename C, typename Next>
    requires route<node<C, Next>>
    auto endpoint_of(const node<C, Next>& route) noexcept -> const endpoint& {
        return endpoint_of(route.next);
    }

    namespace detail {
        template <typename T>
        struct server_types {};

        template <>
        struct server_types<endpoint> {
            using type = std::tuple<>;
        };

        template <typename C, typename Next>
        struct server_types<node<C, Next>> {
            using type = decltype(std::tuple_cat(
                std::declval<std::tuple<typename C::server_type>>(),
                std::declval<typename server_types<Next>::type>()
            ));
        };

        template <typename T>
        struct client_types {};

        template <>
        struct client_types<endpoint> {
            using type = std::tuple<>;
        };

        template <typename C, typename Next>
        struct client_types<node<C, Next>> {
            using type = decltype(std::tuple_cat(
                std::declval<std::tuple<typename C::client_type>>(),
                std::declval<typename client_types<Next>::type>()
            ));
        };
    }

    template <route R>
    using server_types_t =
        typename detail::server_types<std::remove_cvref_t<R>>::type;

    template <route R>
    using client_types_t =
        typename detail::client_types<std::remove_cvref_t<R>>::type;
}
