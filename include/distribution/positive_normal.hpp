// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Normal distribution folded onto its upper half, every sample is at least 'mu'.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::positive_normal {

// Moments of the half-normal distribution shifted by 'mu'
[[nodiscard]] distribution_properties properties(double mu = 0, double sigma = 1);

[[nodiscard]] sequence<double> samples(random_generator& generator, std::ptrdiff_t count, double mu = 0,
                                       double sigma = 1, std::optional<double> max = std::nullopt);

} // namespace rdist::distribution::positive_normal
