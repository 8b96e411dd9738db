// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Exponential distribution, sampled by inverting its CDF.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::exponential {

[[nodiscard]] distribution_properties properties(double lambda = 1);

// Non-positive 'max' makes every sample 0
[[nodiscard]] sequence<double> samples(random_generator& generator, std::ptrdiff_t count, double lambda = 1,
                                       std::optional<double> max = std::nullopt);

} // namespace rdist::distribution::exponential
