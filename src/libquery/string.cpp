#include <query/string.h>

#include <curl/curl.h>
#include <memory>
#include <utility>

namespace query {
    string::string() : str(nullptr) {}

    string::string(char* data) : str(data) {}

    string::string(string&& other) : str(std::exchange(other.str, nullptr)) {}

    string::~string() { curl_free(str); }

    string::operator std::string_view() const noexcept {
        if (!str) return {};
        return std::string_view(str);
    }

    auto string::operator=(string&& other) -> string& {
        if (std::addressof(other) != this) {
            curl_free(str);
            str = std::exchange(other.str, nullptr);
        }

        return *this;
    }
}
