// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A custom exception class used throughout the codebase, it carries source location
// info and supports C++20 <format> strings in constructor, which makes diagnostics
// nicer. Chaining & rethrowing such exceptions can even accomplish a pseudo-stacktrace.
// _________________________________________________________________________________

#pragma once

#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "utility/filepath.hpp"


namespace cpa {

// Format string that also captures the location it was written at, default arguments can't
// follow a parameter pack, so the location has to travel together with the format string
template <class... Args>
struct located_format_string {
    std::format_string<Args...> str;
    std::source_location        loc;

    template <class T>
        requires std::is_convertible_v<const T&, std::string_view>
    consteval located_format_string(const T& str, std::source_location loc = std::source_location::current())
        : str(str), loc(loc) {}
};

template <class... Args>
using located_format = located_format_string<std::type_identity_t<Args>...>;

class exception : public std::runtime_error {

    static std::string format_message(std::string_view message, const std::source_location& loc) {
        // Note: ANSI color sequences are supported by most modern terminals
        constexpr std::string_view bold_red = "\033[31;1m";
        constexpr std::string_view cyan     = "\033[36m";
        constexpr std::string_view magenta  = "\033[35m";
        constexpr std::string_view reset    = "\033[0m";

        return std::format("{0}Error   ->{3} {1}cpa::exception{3} thrown at {2}{4}{3}:{2}{5}{3} in function {2}{6}{3}\n"
                           "{0}Message ->{3} {7}",
                           bold_red, cyan, magenta, reset, cpa::trim_filepath(loc.file_name()), loc.line(),
                           loc.function_name(), message);
    }

public:
    exception(std::string_view message, std::source_location loc = std::source_location::current())
        : std::runtime_error(format_message(message, loc)) {}

    template <class Arg, class... Args>
    exception(located_format<Arg, Args...> fmt, Arg&& arg, Args&&... args)
        : exception(std::format(fmt.str, std::forward<Arg>(arg), std::forward<Args>(args)...), fmt.loc) {}

    [[nodiscard]] const char* what() const noexcept override { return std::runtime_error::what(); }
};

} // namespace cpa
