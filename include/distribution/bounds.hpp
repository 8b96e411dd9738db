// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Optional sampling bounds shared by the rejection samplers.
// _________________________________________________________________________________

#pragma once

#include <optional>

#include "generator/range_policy.hpp"


namespace rdist::distribution {

// Resolves the bounds of a rejection sampler. Returns the constant every sample collapses to
// when the bounds leave no room for drawing (nearly equal bounds, an inverted range under
// a policy other than 'swap'), otherwise returns nothing and leaves bounds ready for rejection.
[[nodiscard]] std::optional<double> collapse_bounds(std::optional<double>& min, std::optional<double>& max,
                                                    floating_range_policy policy);

} // namespace rdist::distribution
