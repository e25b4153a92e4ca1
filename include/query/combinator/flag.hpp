#pragma once

#include "named.hpp"

#include <query/route.hpp>

namespace query {
    /// A boolean query parameter inferred from the key's presence.
    ///
    /// A key without a value, or with the value "true", "1" or "" is true.
    /// Any other value, or a missing key, is false.
    struct flag : detail::named {
        using server_type = bool;
        using client_type = bool;

        explicit flag(
            std::string_view name,
            std::string_view description = {},
            std::vector<std::string> values = {}
        );

        auto decode(const parsed_query& query) const -> bool;

        template <typename Next>
        auto serve(const parsed_query& query, Next&& next) const
            -> decltype(auto)
        {
            return std::forward<Next>(next)(decode(query));
        }

        template <typename Next>
        auto client(request&& req, bool value, Next&& next) const -> request {
            if (value) req.append(name, std::nullopt);
            return std::forward<Next>(next)(std::move(req));
        }

        template <typename Next>
        auto document(docs::action&& action, Next&& next) const
            -> docs::action
        {
            return std::forward<Next>(next)(
                std::move(action).register_param(doc(docs::param_kind::flag))
            );
        }
    };
}
