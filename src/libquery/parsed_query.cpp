#include <query/parsed_query.hpp>

#include <algorithm>
#include <cstring>
#include <ext/string.h>
#include <timber/timber>

namespace query {
    parsed_query::parsed_query(std::string_view raw) {
        if (raw.starts_with('?')) raw.remove_prefix(1);
        if (raw.empty()) return;

        auto buffer = std::unique_ptr<char[]>(new char[raw.size()]);
        std::memcpy(buffer.get(), raw.data(), raw.size());

        const auto text = std::string_view(buffer.get(), raw.size());

        for (const auto token : ext::string_range(text, "&")) {
            if (token.empty()) continue;

            const auto delim = token.find('=');

            if (delim == std::string_view::npos) {
                entries.push_back({.key = token, .value = std::nullopt});
                continue;
            }

            entries.push_back({
                .key = token.substr(0, delim),
                .value = token.substr(delim + 1)
            });
        }

        storage = std::move(buffer);

        TIMBER_TRACE("Parsed query string with {} entries", entries.size());
    }

    auto parsed_query::begin() const noexcept -> const_iterator {
        return entries.begin();
    }

    auto parsed_query::contains(std::string_view name) const noexcept -> bool {
        return std::any_of(
            entries.begin(),
            entries.end(),
            [name](const entry& e) { return e.key == name; }
        );
    }

    auto parsed_query::empty() const noexcept -> bool {
        return entries.empty();
    }

    auto parsed_query::end() const noexcept -> const_iterator {
        return entries.end();
    }

    auto parsed_query::find(std::string_view name) const -> lookup {
        for (const auto& e : entries) {
            if (e.key != name) continue;

            if (e.value) return *e.value;
            return no_value();
        }

        return absent();
    }

    auto parsed_query::find_all(std::string_view name) const
        -> std::vector<std::optional<std::string_view>>
    {
        auto result = std::vector<std::optional<std::string_view>>();

        for (const auto& e : entries) {
            const auto array_style =
                e.key.size() == name.size() + 2 &&
                e.key.starts_with(name) &&
                e.key.ends_with("[]");

            if (e.key == name || array_style) result.push_back(e.value);
        }

        return result;
    }

    auto parsed_query::size() const noexcept -> std::size_t {
        return entries.size();
    }

    auto parse(std::string_view raw) -> parsed_query {
        return parsed_query(raw);
    }
}
