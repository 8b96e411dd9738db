// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Log-normal distribution, sampled as 'exp()' of normal samples.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"


namespace rdist::distribution::log_normal {

// 'mu' and 'sigma' are parameters of the underlying normal distribution
[[nodiscard]] distribution_properties properties(double mu = 0, double sigma = 1);

// Bounds apply to the log-normal values, they are log-transformed before normal sampling.
// Non-positive 'min' means no lower bound, non-positive 'max' makes every sample 0.
[[nodiscard]] sequence<double> samples(random_generator& generator, std::ptrdiff_t count, double mu = 0,
                                       double sigma = 1, std::optional<double> min = std::nullopt,
                                       std::optional<double> max = std::nullopt);

} // namespace rdist::distribution::log_normal
