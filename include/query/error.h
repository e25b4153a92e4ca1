#pragma once

#include <fmt/core.h>
#include <stdexcept>

namespace query {
    class client_error : public std::runtime_error {
    public:
        template <typename ...Args>
        client_error(std::string_view format_str, Args&&... args) :
            std::runtime_error(fmt::format(
                fmt::runtime(format_str),
                std::forward<Args>(args)...
            ))
        {}
    };

    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };
}
