#include <query/client.hpp>

#include <timber/timber>

namespace query {
    namespace detail {
        auto build(const endpoint& route, request&& req) -> request {
            TIMBER_TRACE(
                "Built {} request for '{}': {}",
                req.method,
                route.name,
                req.query_string()
            );
            return std::move(req);
        }
    }

    client::client(std::string_view base_url) : base_url(base_url) {}

    auto client::url() const noexcept -> const query::url& {
        return base_url;
    }
}
