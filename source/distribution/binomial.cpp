// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/binomial.hpp"

#include <algorithm>
#include <cmath>

#include "utility/math.hpp"


rdist::distribution_properties rdist::distribution::binomial::properties(std::uint32_t n, double p) {
    if (std::isnan(p)) return distribution_properties::undefined();

    p = std::clamp(p, 0.0, 1.0);

    const double trials = n;

    return {
        .maximum  = trials,
        .mean     = trials * p,
        .median   = rdist::nan, // no closed form
        .minimum  = 0,
        .mode     = {std::min(std::floor(p * (trials + 1)), trials)},
        .variance = trials * p * (1 - p),
    };
}

rdist::sequence<std::uint32_t> rdist::distribution::binomial::samples(random_generator& generator,
                                                                      std::ptrdiff_t count, std::uint32_t n,
                                                                      double p) {
    p = std::clamp(p, 0.0, 1.0); // NaN stays NaN and never succeeds

    return sequence<std::uint32_t>(count, [&generator, n, p] {
        std::uint32_t successes = 0;
        for (std::uint32_t i = 0; i < n; ++i)
            if (generator.next_double() < p) ++successes;
        return successes;
    });
}
