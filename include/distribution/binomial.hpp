// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Binomial distribution, number of successes in 'n' Bernoulli trials.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <cstdint>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::binomial {

// 'p' is clamped to '[0, 1]', NaN 'p' leaves every property undefined
[[nodiscard]] distribution_properties properties(std::uint32_t n = 1, double p = 0.5);

// Draws 'n' uniform values per sample, cost is linear in 'n'
[[nodiscard]] sequence<std::uint32_t> samples(random_generator& generator, std::ptrdiff_t count,
                                              std::uint32_t n = 1, double p = 0.5);

} // namespace rdist::distribution::binomial
