#include <query/combinator/named.hpp>
#include <query/error.h>

#include <timber/timber>

using namespace std::literals;

namespace {
    constexpr auto reserved = "&=?#"sv;

    auto validate(std::string_view name) -> std::string_view {
        if (name.empty()) {
            TIMBER_DEBUG("Rejected query parameter with an empty name");
            throw query::error("Query parameter name must not be empty");
        }

        const auto pos = name.find_first_of(reserved);

        if (pos != std::string_view::npos) {
            TIMBER_DEBUG("Rejected query parameter '{}'", name);

            throw query::error(
                "Query parameter name '{}' contains reserved character '{}'",
                name,
                name[pos]
            );
        }

        return name;
    }
}

namespace query::detail {
    named::named(
        std::string_view name,
        std::string_view description,
        std::vector<std::string>&& values
    ) :
        name(validate(name)),
        description(description),
        values(std::move(values))
    {}

    auto named::doc(docs::param_kind kind) const -> docs::param {
        return docs::param {
            .name = name,
            .kind = kind,
            .description = description,
            .values = values
        };
    }
}
