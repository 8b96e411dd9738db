// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Wraps <glaze/json.hpp> library include and enables 'distribution_parameters'
// parsing/serialization as a single round-trip string. Also adds a simpler
// read/write API with errors through exceptions so can have a uniform error
// handling style throughout the codebase.
// _________________________________________________________________________________

#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-braces" // false positive in 'glaze'
#endif

#include <glaze/json.hpp> // IWYU pragma: export

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include "codec.hpp"
#include "parameters.hpp"
#include "utility/exception.hpp"


// --- Parameters parsing/serialization support ---
// ------------------------------------------------

namespace glz {

// Parameters are stored as their round-trip string, e.g. "9:-Infinity;Infinity:0;1:",
// this keeps the JSON compact & exact, see https://stephenberry.github.io/glaze/custom-serialization/
template <>
struct from<JSON, rdist::distribution_parameters> {
    template <auto opts>
    static void op(rdist::distribution_parameters& value, is_context auto&& ctx, auto&& it, auto&& end) noexcept {
        std::string text;
        parse<JSON>::op<opts>(text, ctx, it, end);
        if (bool(ctx.error)) return;

        auto parsed = rdist::codec::parse_round_trip(text);
        if (!parsed) {
            ctx.error = glz::error_code::syntax_error;
            return;
        }

        value = std::move(*parsed);
    }
};

template <>
struct to<JSON, rdist::distribution_parameters> {
    template <auto opts>
    static void op(const rdist::distribution_parameters& value, is_context auto&& ctx, auto&& b, auto&& ix) noexcept {
        serialize<JSON>::op<opts>(rdist::codec::format_round_trip(value), ctx, b, ix);
    }
};

} // namespace glz


// --- Read/write wrappers ---
// ---------------------------

namespace rdist {

template <glz::read_supported<glz::JSON> T, auto opts = glz::opts{.error_on_unknown_keys = false}>
[[nodiscard]] std::expected<T, std::string> try_read_json(const std::string& json) {
    T                    value;
    const glz::error_ctx err = glz::read<opts>(value, json);

    if (err) {
        std::string context = std::format("Could not read JSON, error:\n{}", glz::format_error(err, json));
        return std::unexpected{std::move(context)};
    }

    return value;
}

template <glz::read_supported<glz::JSON> T, auto opts = glz::opts{.error_on_unknown_keys = false}>
[[nodiscard]] T read_json(const std::string& json) {
    auto result = try_read_json<T, opts>(json);

    if (result) return std::move(result.value());
    else throw rdist::exception{result.error()};
}

template <glz::write_supported<glz::JSON> T, auto opts = glz::opts{}>
[[nodiscard]] std::string write_json(T&& value) {
    std::string          buffer;
    const glz::error_ctx err = glz::write<opts>(std::forward<T>(value), buffer);

    if (err) throw rdist::exception{"Could not write JSON, error:\n{}", glz::format_error(err)};

    return buffer;
}

template <glz::write_supported<glz::JSON> T>
[[nodiscard]] std::string write_jsonc(T&& value) {
    return write_json<T, glz::opts{.prettify = true, .indentation_width = 4}>(std::forward<T>(value));
}

} // namespace rdist
