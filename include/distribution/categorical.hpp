// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Categorical distribution over indices '0 .. k-1' with arbitrary weights,
// sampled by binary search over the cumulative distribution.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::categorical {

// Weights are normalized first (negative weights count as 0), empty weights mean 3 equal categories,
// zero total weight throws 'rdist::domain_error'
[[nodiscard]] distribution_properties properties(const std::vector<double>& weights = {});
[[nodiscard]] distribution_properties properties(std::int32_t k); // 'k' equal categories, at least 1

[[nodiscard]] sequence<std::size_t> samples(random_generator& generator, std::ptrdiff_t count,
                                            const std::vector<double>& weights = {});
[[nodiscard]] sequence<std::size_t> samples(random_generator& generator, std::ptrdiff_t count, std::int32_t k);

// Index of the first cumulative weight that is not below 'u'
[[nodiscard]] std::size_t invert_cdf(std::span<const double> cdf, double u) noexcept;

} // namespace rdist::distribution::categorical
