#pragma once

#include "named.hpp"

#include <query/converter.hpp>
#include <query/route.hpp>

#include <vector>

namespace query {
    /// A query parameter that may appear any number of times.
    ///
    /// Both 'name' and 'name[]' are accepted, in any mix. Handlers receive
    /// the values that could be decoded, in the order they appeared;
    /// occurrences without a value and values that fail to decode are
    /// skipped.
    template <convertible T>
    struct params : detail::named {
        using value_type = T;
        using server_type = std::vector<T>;
        using client_type = std::vector<T>;

        explicit params(
            std::string_view name,
            std::string_view description = {},
            std::vector<std::string> values = {}
        ) :
            named(name, description, std::move(values))
        {}

        auto decode(const parsed_query& query) const -> server_type {
            auto result = server_type();

            for (const auto& value : query.find_all(name)) {
                if (!value) continue;

                if (auto decoded = converter<T>::decode(*value)) {
                    result.push_back(std::move(*decoded));
                }
            }

            return result;
        }

        template <typename Next>
        auto serve(const parsed_query& query, Next&& next) const
            -> decltype(auto)
        {
            return std::forward<Next>(next)(decode(query));
        }

        template <typename Next>
        auto client(request&& req, const client_type& values, Next&& next) const
            -> request
        {
            for (const auto& value : values) {
                const auto text = converter<T>::encode(value);
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
                    doc(docs::param_kind::multi)
                )
            );
        }
    };
}
