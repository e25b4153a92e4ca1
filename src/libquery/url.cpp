#include <query/error.h>
#include <query/url.h>

#include <utility>

namespace query {
    url::url() : handle(curl_url()) {
        if (!handle) throw client_error("Failed to allocate URL handle");
    }

    url::url(const char* str) : url() { set(CURLUPART_URL, str); }

    url::url(std::string_view string) : url() { set(CURLUPART_URL, string); }

    url::url(const url& other) : handle(curl_url_dup(other.handle)) {
        if (!handle) throw client_error("Failed to duplicate URL handle");
    }

    url::url(url&& other) : handle(std::exchange(other.handle, nullptr)) {}

    url::~url() { curl_url_cleanup(handle); }

    auto url::operator=(const url& other) -> url& {
        if (handle != other.handle) {
            curl_url_cleanup(handle);

            handle = curl_url_dup(other.handle);
            if (!handle) throw client_error("Failed to duplicate URL handle");
        }

        return *this;
    }

    auto url::operator=(url&& other) -> url& {
        if (handle != other.handle) {
            curl_url_cleanup(handle);
            handle = std::exchange(other.handle, nullptr);
        }

        return *this;
    }

    auto url::append_query(
        std::string_view key,
        std::optional<std::string_view> value
    ) -> void {
        const auto item = value ?
            fmt::format("{}={}", key, *value) :
            std::string(key);

        set(
            CURLUPART_QUERY,
            item.c_str(),
            CURLU_APPENDQUERY | CURLU_URLENCODE
        );
    }

    auto url::check_return_code(CURLUcode code) const -> void {
        if (code != CURLUE_OK) throw client_error(curl_url_strerror(code));
    }

    auto url::get(CURLUPart what, unsigned int flags) const
        -> ::query::string {
        char* part = nullptr;
        check_return_code(curl_url_get(handle, what, &part, flags));
        return ::query::string(part);
    }

    auto url::host() const -> std::optional<::query::string> {
        return try_get(CURLUPART_HOST, CURLUE_NO_HOST);
    }

    auto url::path() const -> ::query::string { return get(CURLUPART_PATH); }

    auto url::query() const -> std::optional<::query::string> {
        return try_get(CURLUPART_QUERY, CURLUE_NO_QUERY);
    }

    auto url::scheme() const -> std::optional<::query::string> {
        return try_get(CURLUPART_SCHEME, CURLUE_NO_SCHEME);
    }

    auto url::set(CURLUPart part, const char* content, unsigned int flags)
        -> void {
        check_return_code(curl_url_set(handle, part, content, flags));
    }

    auto url::set(CURLUPart part, std::string_view content, unsigned int flags)
        -> void {
        const auto terminated = std::string(content);
        set(part, terminated.c_str(), flags);
    }

    auto url::string() const -> ::query::string { return get(CURLUPART_URL); }

    auto url::try_get(CURLUPart what, CURLUcode none, unsigned int flags) const
        -> std::optional<::query::string> {
        char* part = nullptr;
        const auto code = curl_url_get(handle, what, &part, flags);

        if (code == CURLUE_OK) return ::query::string(part);
        if (code == none) return std::nullopt;

        throw client_error(curl_url_strerror(code));
    }
}
