#include <query/request.h>

#include <timber/timber>
#include <utility>

namespace query {
    request::request(std::string_view method, const query::url& url) :
        method(method),
        url(url)
    {}

    auto request::append(
        std::string_view name,
        std::optional<std::string_view> value
    ) & -> request& {
        url.append_query(name, value);

        if (value) {
            TIMBER_TRACE(
                "{} request appended query parameter '{}={}'",
                method,
                name,
                *value
            );
        }
        else TIMBER_TRACE("{} request appended query flag '{}'", method, name);

        return *this;
    }

    auto request::append(
        std::string_view name,
        std::optional<std::string_view> value
    ) && -> request {
        append(name, value);
        return std::move(*this);
    }

    auto request::query_string() const -> std::string {
        if (const auto query = url.query()) {
            return std::string(std::string_view(*query));
        }

        return std::string();
    }
}
