#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace query {
    /// The key does not appear in the query string.
    struct absent {};

    /// The key appears without an '=' sign.
    struct no_value {};

    /// Result of looking up a single key.
    using lookup = std::variant<absent, no_value, std::string_view>;

    /// A key and its value. The value is empty when the key was given
    /// without an '=' sign; an explicitly empty value ("key=") is an empty
    /// string.
    struct entry {
        std::string_view key;
        std::optional<std::string_view> value;
    };

    /// An ordered multi-map of the parameters in a query string.
    ///
    /// Entries keep the order in which they appeared, duplicates included.
    /// Keys and values point into storage owned by this object.
    class parsed_query {
        std::unique_ptr<const char[]> storage;
        std::vector<entry> entries;
    public:
        using const_iterator = std::vector<entry>::const_iterator;

        parsed_query() = default;

        explicit parsed_query(std::string_view raw);

        parsed_query(const parsed_query&) = delete;

        parsed_query(parsed_query&&) = default;

        auto operator=(const parsed_query&) -> parsed_query& = delete;

        auto operator=(parsed_query&&) -> parsed_query& = default;

        auto begin() const noexcept -> const_iterator;

        auto contains(std::string_view name) const noexcept -> bool;

        auto empty() const noexcept -> bool;

        auto end() const noexcept -> const_iterator;

        /// Returns the first entry named 'name'.
        auto find(std::string_view name) const -> lookup;

        /// Returns the values of every entry named 'name' or 'name[]', in
        /// the order they appear.
        auto find_all(std::string_view name) const
            -> std::vector<std::optional<std::string_view>>;

        auto size() const noexcept -> std::size_t;
    };

    /// Splits an already percent-decoded query string into its parameters.
    auto parse(std::string_view raw) -> parsed_query;
}
