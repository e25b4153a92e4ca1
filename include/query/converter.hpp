#pragma once

#include <charconv>
#include <chrono>
#include <concepts>
#include <filesystem>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace query {
    /// Converts values to and from the text of a query parameter.
    ///
    /// Specializations provide two static functions:
    ///     decode(std::string_view) -> std::optional<T>
    ///     encode(const T&) -> std::string
    ///
    /// 'decode' reports failure with an empty optional and never throws.
    /// 'encode' must accept every value of T.
    template <typename T>
    struct converter {};

    template <typename T>
    concept convertible = requires(std::string_view text, const T& value) {
        { converter<T>::decode(text) } -> std::same_as<std::optional<T>>;
        { converter<T>::encode(value) } -> std::same_as<std::string>;
    };

    template <>
    struct converter<std::string> {
        static auto decode(
            std::string_view text
        ) -> std::optional<std::string> {
            return std::string(text);
        }

        static auto encode(const std::string& value) -> std::string {
            return value;
        }
    };

    template <>
    struct converter<bool> {
        static auto decode(std::string_view text) -> std::optional<bool> {
            if (text.size() == 1) {
                switch (text[0]) {
                    case 't':
                    case 'y':
                        return true;
                    case 'f':
                    case 'n':
                        return false;
                    default:
                        break;
                }
            }
            else if (text == "true" || text == "yes") return true;
            else if (text == "false" || text == "no") return false;

            return std::nullopt;
        }

        static auto encode(bool value) -> std::string {
            return value ? "true" : "false";
        }
    };

    template <typename T>
    requires std::integral<T> || std::floating_point<T>
    struct converter<T> {
        static auto decode(std::string_view text) -> std::optional<T> {
            if (text.empty()) return std::nullopt;

            const auto* const first = text.data();
            const auto* const last = first + text.size();

            auto value = T();
            const auto [ptr, ec] = std::from_chars(first, last, value);

            if (ec != std::errc() || ptr != last) return std::nullopt;
            return value;
        }

        static auto encode(T value) -> std::string {
            return fmt::to_string(value);
        }
    };

    template <typename Rep, typename Period>
    struct converter<std::chrono::duration<Rep, Period>> {
        using duration = std::chrono::duration<Rep, Period>;

        static auto decode(std::string_view text) -> std::optional<duration> {
            if (const auto count = converter<Rep>::decode(text)) {
                return duration(*count);
            }

            return std::nullopt;
        }

        static auto encode(const duration& value) -> std::string {
            return converter<Rep>::encode(value.count());
        }
    };

    template <>
    struct converter<std::filesystem::path> {
        static auto decode(
            std::string_view text
        ) -> std::optional<std::filesystem::path> {
            if (text.empty()) return std::nullopt;
            return std::filesystem::path(text);
        }

        static auto encode(const std::filesystem::path& value) -> std::string {
            return value.string();
        }
    };

    template <>
    struct converter<nlohmann::json> {
        static auto decode(
            std::string_view text
        ) -> std::optional<nlohmann::json> {
            auto json = nlohmann::json::parse(text, nullptr, false);
            if (json.is_discarded()) return std::nullopt;
            return json;
        }

        static auto encode(const nlohmann::json& value) -> std::string {
            return value.dump();
        }
    };
}
