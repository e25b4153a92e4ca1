#include <query/combinator/flag.hpp>

namespace query {
    flag::flag(
        std::string_view name,
        std::string_view description,
        std::vector<std::string> values
    ) :
        named(name, description, std::move(values))
    {}

    auto flag::decode(const parsed_query& query) const -> bool {
        return std::visit(detail::overloaded {
            [](absent) { return false; },
            [](no_value) { return true; },
            [](std::string_view text) {
                return text == "true" || text == "1" || text.empty();
            }
        }, query.find(name));
    }
}
