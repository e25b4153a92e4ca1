#pragma once

#include <query/url.h>

#include <optional>
#include <string>
#include <string_view>

namespace query {
    class request {
    public:
        std::string method = "GET";
        query::url url;

        request() = default;

        request(std::string_view method, const query::url& url);

        auto append(
            std::string_view name,
            std::optional<std::string_view> value
        ) & -> request&;

        auto append(
            std::string_view name,
            std::optional<std::string_view> value
        ) && -> request;

        /// Returns the query string, or an empty string if there is none.
        auto query_string() const -> std::string;
    };
}
