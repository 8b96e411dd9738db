// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "codec.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <utility>
#include <vector>

#include "utility/error_messages.hpp"
#include "utility/exception.hpp"


constexpr std::string_view positive_infinity = "Infinity";
constexpr std::string_view negative_infinity = "-Infinity";
constexpr std::string_view not_a_number      = "NaN";

constexpr std::string_view whitespace = " \t\n\r\f\v";

// --- Text helpers ---
// --------------------

[[nodiscard]] std::string_view trim(std::string_view str) {
    const std::size_t first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};

    const std::size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

[[nodiscard]] bool is_blank(std::string_view str) { return trim(str).empty(); }

[[nodiscard]] std::vector<std::string_view> split(std::string_view str, char delimiter) {
    std::vector<std::string_view> segments;

    std::size_t start = 0;
    for (std::size_t pos = str.find(delimiter); pos != std::string_view::npos; pos = str.find(delimiter, start)) {
        segments.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    segments.push_back(str.substr(start));

    return segments;
}

[[nodiscard]] bool starts_with_symbol(std::string_view str, std::string_view symbol) {
    return str.substr(0, symbol.size()) == symbol;
}

// --- Numbers ---
// ---------------

[[nodiscard]] std::optional<double> non_finite_from_chars(std::string_view str) {
    if (str == positive_infinity || str == "+Infinity") return std::numeric_limits<double>::infinity();
    if (str == negative_infinity) return -std::numeric_limits<double>::infinity();
    if (str == not_a_number) return std::numeric_limits<double>::quiet_NaN();
    return std::nullopt;
}

// Locale-independent, the whole string must be consumed
[[nodiscard]] std::optional<double> number_from_chars(std::string_view str) {
    str = trim(str);

    if (const auto special = non_finite_from_chars(str)) return special;

    if (starts_with_symbol(str, "+")) str.remove_prefix(1);
    if (str.empty()) return std::nullopt;

    double value{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

// Accepts the decimal point & digit grouping of 'locale'
[[nodiscard]] std::optional<double> number_from_chars(std::string_view str, const std::locale& locale) {
    const auto& punct = std::use_facet<std::numpunct<char>>(locale);

    std::string normalized;
    normalized.reserve(str.size());

    for (const char c : trim(str)) {
        if (c == punct.decimal_point()) normalized.push_back('.');
        else if (c == punct.thousands_sep() && !punct.grouping().empty()) continue;
        else normalized.push_back(c);
    }

    return number_from_chars(normalized);
}

[[nodiscard]] std::optional<std::uint8_t> precision_from_chars(std::string_view str) {
    str = trim(str);

    unsigned int value{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (str.empty() || ec != std::errc{} || ptr != str.data() + str.size()) return std::nullopt;
    if (value > std::numeric_limits<std::uint8_t>::max()) return std::nullopt;

    return static_cast<std::uint8_t>(value);
}

// Shortest representation that parses back to the exact same double
[[nodiscard]] std::string number_to_chars(double value) {
    if (std::isnan(value)) return std::string(not_a_number);
    if (std::isinf(value)) return std::string(value > 0 ? positive_infinity : negative_infinity);
    return std::format("{}", value);
}

[[nodiscard]] std::string number_to_chars(double value, const std::locale& locale) {
    if (std::isnan(value)) return std::string(not_a_number);
    if (std::isinf(value)) return std::string(value > 0 ? positive_infinity : negative_infinity);
    return std::format(locale, "{:.2Lf}", value);
}

// Builds the parameters value once the text has been split into its parts
[[nodiscard]] std::optional<rdist::distribution_parameters> assemble(rdist::distribution_type    type,
                                                                     std::optional<double>       min,
                                                                     std::optional<double>       max,
                                                                     const std::vector<double>&  values,
                                                                     std::optional<std::uint8_t> precision) {
    auto shape = rdist::shape_from_values(type, values);
    if (!shape) return std::nullopt;

    return rdist::distribution_parameters{std::move(*shape), min, max, precision};
}

// --- Format id ---
// -----------------

rdist::codec::format_id rdist::codec::parse_format_id(std::string_view id) {
    const std::string_view trimmed = trim(id);

    if (trimmed.empty() || trimmed == "g" || trimmed == "G") return format_id::general;
    if (trimmed == "r" || trimmed == "R") return format_id::round_trip;

    throw rdist::domain_error{"{} Got {{ {} }}.", rdist::error_message(error_kind::unrecognized_format), id};
}

// --- Formatting ---
// ------------------

std::string rdist::codec::format_general(const distribution_parameters& value, const std::locale& locale) {
    std::string str = std::format("{} distribution", rdist::distribution_type_name(value.type()));

    if (value.min() || value.max()) {
        const double min = value.min().value_or(-std::numeric_limits<double>::infinity());
        const double max = value.max().value_or(std::numeric_limits<double>::infinity());

        str += std::format(" ({};{})", number_to_chars(min, locale), number_to_chars(max, locale));
    }

    if (const auto values = value.shape_values(); !values.empty()) {
        str += " [";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i) str += ';';
            str += number_to_chars(values[i], locale);
        }
        str += ']';
    }

    if (const auto precision = value.precision()) str += std::format(" r:{}", *precision);

    return str;
}

std::string rdist::codec::format_round_trip(const distribution_parameters& value) {
    const double min = value.min().value_or(-std::numeric_limits<double>::infinity());
    const double max = value.max().value_or(std::numeric_limits<double>::infinity());

    std::string str =
        std::format("{}:{};{}:", static_cast<int>(value.type()), number_to_chars(min), number_to_chars(max));

    const auto values = value.shape_values();
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) str += ';';
        str += number_to_chars(values[i]);
    }

    str += ':';

    if (const auto precision = value.precision()) str += std::format("{}", *precision);

    return str;
}

std::string rdist::codec::format(const distribution_parameters& value, std::string_view id,
                                 const std::locale& locale) {
    switch (parse_format_id(id)) {
    case format_id::general: return format_general(value, locale);
    case format_id::round_trip: return format_round_trip(value);
    }
    std::unreachable();
}

// --- Parsing ---
// ---------------

std::optional<rdist::distribution_parameters> rdist::codec::parse_general(std::string_view text,
                                                                          const std::locale& locale) {
    constexpr std::string_view suffix = " distribution";

    std::string_view rest = trim(text);

    // Kind name
    const std::size_t name_end = rest.find(suffix);
    if (name_end == std::string_view::npos) return std::nullopt;

    const auto type = rdist::distribution_type_from_name(rest.substr(0, name_end));
    if (!type) return std::nullopt;

    rest = trim(rest.substr(name_end + suffix.size()));

    // Bounds
    std::optional<double> min;
    std::optional<double> max;

    if (starts_with_symbol(rest, "(")) {
        const std::size_t close = rest.find(')');
        if (close == std::string_view::npos) return std::nullopt;

        const auto bounds = split(rest.substr(1, close - 1), ';');
        if (bounds.size() != 2) return std::nullopt;

        min = number_from_chars(bounds[0], locale);
        max = number_from_chars(bounds[1], locale);
        if (!min || !max) return std::nullopt;

        rest = trim(rest.substr(close + 1));
    }

    // Shape parameters
    std::vector<double> values;

    if (starts_with_symbol(rest, "[")) {
        const std::size_t close = rest.find(']');
        if (close == std::string_view::npos) return std::nullopt;

        const std::string_view list = rest.substr(1, close - 1);

        if (!is_blank(list)) {
            for (const auto segment : split(list, ';')) {
                const auto number = number_from_chars(segment, locale);
                if (!number) return std::nullopt;
                values.push_back(*number);
            }
        }

        rest = trim(rest.substr(close + 1));
    }

    // Precision
    std::optional<std::uint8_t> precision;

    if (starts_with_symbol(rest, "r:")) {
        precision = precision_from_chars(rest.substr(2));
        if (!precision) return std::nullopt;

        rest = {};
    }

    if (!rest.empty()) return std::nullopt; // trailing garbage

    return assemble(*type, min, max, values, precision);
}

std::optional<rdist::distribution_parameters> rdist::codec::parse_round_trip(std::string_view text) {
    const auto fields = split(trim(text), ':');
    if (fields.size() != 4) return std::nullopt;

    // Kind index
    const std::string_view index_field = trim(fields[0]);

    std::size_t index{};
    const auto [ptr, ec] = std::from_chars(index_field.data(), index_field.data() + index_field.size(), index);
    if (index_field.empty() || ec != std::errc{} || ptr != index_field.data() + index_field.size()) return std::nullopt;

    const auto type = rdist::distribution_type_from_index(index);
    if (!type) return std::nullopt;

    // Bounds
    const auto bounds = split(fields[1], ';');
    if (bounds.size() != 2) return std::nullopt;

    const auto min = number_from_chars(bounds[0]);
    const auto max = number_from_chars(bounds[1]);
    if (!min || !max) return std::nullopt;

    // Shape parameters
    std::vector<double> values;

    if (!is_blank(fields[2])) {
        for (const auto segment : split(fields[2], ';')) {
            const auto number = number_from_chars(segment);
            if (!number) return std::nullopt;
            values.push_back(*number);
        }
    }

    // Precision
    std::optional<std::uint8_t> precision;

    if (!is_blank(fields[3])) {
        precision = precision_from_chars(fields[3]);
        if (!precision) return std::nullopt;
    }

    return assemble(*type, min, max, values, precision);
}

bool rdist::codec::try_parse(std::string_view text, distribution_parameters& result, const std::locale& locale) {
    if (!is_blank(text)) {
        if (auto parsed = parse_general(text, locale)) {
            result = std::move(*parsed);
            return true;
        }
        if (auto parsed = parse_round_trip(text)) {
            result = std::move(*parsed);
            return true;
        }
    }

    result = distribution_parameters::zero();
    return false;
}

bool rdist::codec::try_parse_exact(std::string_view text, std::string_view id, distribution_parameters& result,
                                   const std::locale& locale) {
    result = distribution_parameters{};

    if (is_blank(text)) return false;

    std::optional<distribution_parameters> parsed;

    switch (parse_format_id(id)) {
    case format_id::general: parsed = parse_general(text, locale); break;
    case format_id::round_trip: parsed = parse_round_trip(text); break;
    }

    if (!parsed) return false;

    result = std::move(*parsed);
    return true;
}

rdist::distribution_parameters rdist::codec::parse(std::string_view text, const std::locale& locale) {
    distribution_parameters result;

    if (!try_parse(text, result, locale))
        throw rdist::format_error{"{} Got {{ {} }}.", rdist::error_message(error_kind::invalid_parameters), text};

    return result;
}

rdist::distribution_parameters rdist::codec::parse_exact(std::string_view text, std::string_view id,
                                                         const std::locale& locale) {
    distribution_parameters result;

    if (!try_parse_exact(text, id, result, locale))
        throw rdist::format_error{"{} Got {{ {} }} for format {{ {} }}.",
                                  rdist::error_message(error_kind::invalid_parameters), text, id};

    return result;
}
