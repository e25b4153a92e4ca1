#pragma once

#include <query/route.hpp>

namespace query {
    namespace detail {
        auto document(const endpoint& route, docs::action&& action)
            -> docs::action;

        template <docs_interpretable C, typename Next>
        auto document(const node<C, Next>& route, docs::action&& action)
            -> docs::action
        {
            return route.combinator.document(
                std::move(action),
                [&](docs::action&& next) -> docs::action {
                    return detail::document(route.next, std::move(next));
                }
            );
        }
    }

    template <route R>
    auto document(const R& route) -> docs::action {
        return detail::document(route, docs::action());
    }
}
