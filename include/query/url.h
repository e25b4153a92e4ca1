#pragma once

#include <query/string.h>

#include <curl/curl.h>
#include <fmt/format.h>
#include <optional>
#include <string>

namespace query {
    class url final {
        CURLU* handle;

        auto check_return_code(CURLUcode code) const -> void;

        auto get(CURLUPart what, unsigned int flags = 0) const
            -> ::query::string;

        auto set(
            CURLUPart part,
            const char* content,
            unsigned int flags = 0
        ) -> void;

        auto set(
            CURLUPart part,
            std::string_view content,
            unsigned int flags = 0
        ) -> void;

        auto try_get(
            CURLUPart what,
            CURLUcode none,
            unsigned int flags = 0
        ) const -> std::optional<::query::string>;
    public:
        url();

        url(const char* str);

        url(std::string_view string);

        url(const url& other);

        url(url&& other);

        ~url();

        auto operator=(const url& other) -> url&;

        auto operator=(url&& other) -> url&;

        auto append_query(
            std::string_view key,
            std::optional<std::string_view> value
        ) -> void;

        auto host() const -> std::optional<::query::string>;

        auto path() const -> ::query::string;

        auto query() const -> std::optional<::query::string>;

        auto scheme() const -> std::optional<::query::string>;

        auto string() const -> ::query::string;
    };
}

template <>
struct fmt::formatter<query::url> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const query::url& url, FormatContext& ctx) const {
        return formatter<std::string_view>::format(url.string(), ctx);
    }
};
