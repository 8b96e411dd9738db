// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Text encodings of 'distribution_parameters'.
//
// Round-trip format "r" (locale-independent, exact):
//    <kind index>:<min>;<max>:<p0>;<p1>;...:<precision>
//    e.g. "9:-Infinity;Infinity:0;1:"
//
// General format "g" (human-readable, locale-dependent, values shown with 2 decimals):
//    <Kind name> distribution (<min>;<max>) [<p0>;<p1>;...] r:<precision>
//    e.g. "Normal distribution (-1.00;1.00) [0.00;1.00] r:3"
//
// Absent bounds are written as infinities. In the general format each group is
// omitted when there is nothing to show.
// _________________________________________________________________________________

#pragma once

#include <locale>
#include <optional>
#include <string>
#include <string_view>

#include "parameters.hpp"


namespace rdist::codec {

enum class format_id { general, round_trip };

// Case-insensitive, empty or "g" is general, "r" is round-trip, anything else throws 'rdist::domain_error'
[[nodiscard]] format_id parse_format_id(std::string_view id);

// --- Formatting ---
// ------------------

[[nodiscard]] std::string format_general(const distribution_parameters& value, const std::locale& locale = {});
[[nodiscard]] std::string format_round_trip(const distribution_parameters& value);

[[nodiscard]] std::string format(const distribution_parameters& value, std::string_view id = "g",
                                 const std::locale& locale = {});

// --- Parsing ---
// ---------------

[[nodiscard]] std::optional<distribution_parameters> parse_general(std::string_view text,
                                                                   const std::locale& locale = {});
[[nodiscard]] std::optional<distribution_parameters> parse_round_trip(std::string_view text);

// Tries the general format, then the round-trip one. On failure 'result' becomes 'distribution_parameters::zero()'.
bool try_parse(std::string_view text, distribution_parameters& result, const std::locale& locale = {});

// On failure 'result' becomes the default parameters, an unknown 'id' throws 'rdist::domain_error'
bool try_parse_exact(std::string_view text, std::string_view id, distribution_parameters& result,
                     const std::locale& locale = {});

// Throwing counterparts, failures throw 'rdist::format_error'
[[nodiscard]] distribution_parameters parse(std::string_view text, const std::locale& locale = {});
[[nodiscard]] distribution_parameters parse_exact(std::string_view text, std::string_view id,
                                                  const std::locale& locale = {});

} // namespace rdist::codec
