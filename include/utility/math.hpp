// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Floating-point comparison helpers and small numeric utilities shared by
// the generator, the samplers and the parameter codec.
// _________________________________________________________________________________

#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>


namespace rdist {

// Smallest value treated as strictly positive, substituted for non-positive rates & scales
constexpr double nearly_zero = 1e-15;

constexpr double nan = std::numeric_limits<double>::quiet_NaN();
constexpr double inf = std::numeric_limits<double>::infinity();

[[nodiscard]] constexpr double square(double x) noexcept { return x * x; }

[[nodiscard]] constexpr bool is_nearly_zero(double x) noexcept { return x < nearly_zero && x > -nearly_zero; }

[[nodiscard]] bool is_nearly_equal(double a, double b) noexcept;

// Treats NaN as equal to NaN and otherwise compares the object representation,
// this is the notion of equality required for exact round-trips
[[nodiscard]] bool is_same_value(double a, double b) noexcept;

// Rounds half away from zero to 'precision' decimal places, precisions past what
// a double can represent leave the value unchanged
[[nodiscard]] double round_to_precision(double value, std::uint8_t precision) noexcept;

// Clamps negative weights to zero and divides by their total (unless it is already nearly 1),
// empty input produces 3 equal weights, throws 'rdist::domain_error' if the total is nearly zero
[[nodiscard]] std::vector<double> normalize_weights(std::span<const double> weights);

// Non-throwing counterpart of the check above
[[nodiscard]] bool has_nonzero_total_weight(std::span<const double> weights) noexcept;

} // namespace rdist
