#pragma once

#include "named.hpp"

#include <query/converter.hpp>
#include <query/route.hpp>

#include <optional>

namespace query {
    template <convertible T>
    struct param : detail::named {
        using value_type = T;
        using server_type = std::optional<T>;
        using client_type = std::optional<T>;

        explicit param(
            std::string_view name,
            std::string_view description = {},
            std::vector<std::string> values = {}
        ) :
            named(name, description, std::move(values))
        {}

        auto decode(const parsed_query& query) const -> server_type {
            return std::visit(detail::overloaded {
                [](absent) -> server_type { return std::nullopt; },
                [](no_value) -> server_type { return std::nullopt; },
                [](std::string_view text) -> server_type {
                    return converter<T>::decode(text);
                }
            }, query.find(name));
        }

        template <typename Next>
        auto serve(const parsed_query& query, Next&& next) const
            -> decltype(auto)
        {
            return std::forward<Next>(next)(decode(query));
        }

        template <typename Next>
        auto client(request&& req, const client_type& value, Next&& next) const
            -> request
        {
            if (value) {
                const auto text = converter<T>::encode(*value);
                req.append(name, text);
            }

            return std::forward<Next>(next)(std::move(req));
        }

        template <typename Next>
        auto document(docs::action&& action, Next&& next) const
            -> docs::action
        {
            return std::forward<Next>(next)(
                std::move(action).register_param(
                    doc(docs::param_kind::single)
                )
            );
        }
    };
}
