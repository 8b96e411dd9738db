// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Sampling & properties for any 'distribution_parameters' value, including the
// uniform kinds that have no sampler of their own. Samples are rounded to the
// parameters precision when one is set.
// _________________________________________________________________________________

#pragma once

#include <cstddef>

#include "distribution/properties.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"
#include "parameters.hpp"


namespace rdist {

[[nodiscard]] sequence<double> sample(random_generator& generator, const distribution_parameters& parameters,
                                      std::ptrdiff_t count);

[[nodiscard]] distribution_properties properties(const distribution_parameters& parameters);

} // namespace rdist
