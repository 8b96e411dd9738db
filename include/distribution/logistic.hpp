// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Logistic distribution, sampled by inverting its CDF.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::logistic {

[[nodiscard]] distribution_properties properties(double mu = 0, double sigma = 1);

[[nodiscard]] sequence<double> samples(random_generator& generator, std::ptrdiff_t count, double mu = 0,
                                       double sigma = 1, std::optional<double> min = std::nullopt,
                                       std::optional<double> max = std::nullopt);

} // namespace rdist::distribution::logistic
