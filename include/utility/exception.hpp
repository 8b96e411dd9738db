// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Exception classes used throughout the codebase, they carry source location info
// and support C++20 <format> strings in constructor, which makes diagnostics nicer.
//
// 'rdist::domain_error' reports a violated precondition (inverted range under the
// 'exception' policy, zero total weight, null buffer, unknown format identifier),
// 'rdist::format_error' reports text that could not be parsed into parameters.
// _________________________________________________________________________________

#pragma once

#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "utility/filepath.hpp"


namespace rdist {

class exception : public std::runtime_error {

    // clang-format off
    constexpr static std::string_view ansi_error    = "\033[31;1m"; // bold red
    constexpr static std::string_view ansi_location = "\033[2m";    // dim
    constexpr static std::string_view ansi_reset    = "\033[0m";
    // clang-format on

    [[nodiscard]] static std::string compose(std::string_view message, const std::source_location& loc) {
        return std::format("{}rdist error:{} {}\n{}   raised in {} ({}:{}){}", ansi_error, ansi_reset, message,
                           ansi_location, loc.function_name(), rdist::trim_filepath(loc.file_name()), loc.line(),
                           ansi_reset);
    }

public:
    exception(std::string_view message, std::source_location loc = std::source_location::current())
        : std::runtime_error(compose(message, loc)) {}

    // Formatting overloads, a trailing defaulted 'loc' rules out a single variadic pack
    // clang-format off
    template <class A>
    exception(std::format_string<A> fmt, A&& a, std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<A>(a)), loc) {}

    template <class A, class B>
    exception(std::format_string<A, B> fmt, A&& a, B&& b, std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<A>(a), std::forward<B>(b)), loc) {}

    template <class A, class B, class C>
    exception(std::format_string<A, B, C> fmt, A&& a, B&& b, C&& c,
              std::source_location loc = std::source_location::current())
        : exception(std::format(fmt, std::forward<A>(a), std::forward<B>(b), std::forward<C>(c)), loc) {}
    // clang-format on
};

class domain_error : public exception {
public:
    using exception::exception;
};

class format_error : public exception {
public:
    using exception::exception;
};

} // namespace rdist
