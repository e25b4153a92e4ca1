#include <query/docs.hpp>
#include <query/document.hpp>

#include <algorithm>
#include <timber/timber>
#include <utility>

namespace query::docs {
    auto to_string(param_kind kind) noexcept -> std::string_view {
        switch (kind) {
            case param_kind::single: return "single";
            case param_kind::multi: return "multi";
            case param_kind::flag: return "flag";
        }

        __builtin_unreachable();
    }

    auto action::find(std::string_view name) const noexcept -> const param* {
        const auto it = std::find_if(
            params.begin(),
            params.end(),
            [name](const param& p) { return p.name == name; }
        );

        if (it == params.end()) return nullptr;
        return &*it;
    }

    auto action::register_param(param&& entry) && -> action {
        params.push_back(std::move(entry));
        return std::move(*this);
    }
}

namespace query::detail {
    auto document(const endpoint& route, docs::action&& action)
        -> docs::action
    {
        action.name = route.name;
        if (!route.description.empty()) {
            action.description = route.description;
        }

        TIMBER_DEBUG(
            "Documented '{}' with {} query parameters",
            action.name,
            action.params.size()
        );

        return std::move(action);
    }
}
