#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>

namespace query::docs {
    enum class param_kind {
        single,
        multi,
        flag
    };

    auto to_string(param_kind kind) noexcept -> std::string_view;

    struct param {
        std::string name;
        param_kind kind;
        std::string description;
        std::vector<std::string> values;
    };

    struct action {
        std::string name;
        std::string description;
        std::vector<param> params;

        auto find(std::string_view name) const noexcept -> const param*;

        auto register_param(param&& entry) && -> action;
    };
}

template <>
struct fmt::formatter<query::docs::param_kind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(query::docs::param_kind kind, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            query::docs::to_string(kind),
            ctx
        );
    }
};

template <>
struct fmt::formatter<query::docs::param> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const query::docs::param& param, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{} ({})", param.name, param.kind);
    }
};
