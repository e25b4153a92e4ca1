#pragma once

#include <query/docs.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace query::detail {
    template <typename... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    struct named {
        const std::string name;
        const std::string description;
        const std::vector<std::string> values;

        named(
            std::string_view name,
            std::string_view description,
            std::vector<std::string>&& values
        );

        auto doc(docs::param_kind kind) const -> docs::param;
    };
}
