// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Normal distribution, sampled with the polar (Marsaglia) variant of Box-Muller.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::normal {

[[nodiscard]] distribution_properties properties(double mu = 0, double sigma = 1);

// Values come in pairs, when either value of a pair falls outside the bounds the whole pair is redrawn
[[nodiscard]] sequence<double> samples(random_generator& generator, std::ptrdiff_t count, double mu = 0,
                                       double sigma = 1, std::optional<double> min = std::nullopt,
                                       std::optional<double> max = std::nullopt);

// Two independent deviations from the mean scaled by 'sigma', expects a finite positive 'sigma'
[[nodiscard]] std::pair<double, double> deviation_pair(random_generator& generator, double sigma);

} // namespace rdist::distribution::normal
