// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/logistic.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "distribution/bounds.hpp"
#include "utility/math.hpp"


rdist::distribution_properties rdist::distribution::logistic::properties(double mu, double sigma) {
    if (std::isnan(mu) || std::isnan(sigma)) return distribution_properties::undefined();

    sigma = std::max(rdist::nearly_zero, sigma);

    return {
        .maximum  = rdist::inf,
        .mean     = mu,
        .median   = mu,
        .minimum  = -rdist::inf,
        .mode     = {mu},
        .variance = rdist::square(sigma) * rdist::square(std::numbers::pi) / 3,
    };
}

rdist::sequence<double> rdist::distribution::logistic::samples(random_generator& generator, std::ptrdiff_t count,
                                                               double mu, double sigma, std::optional<double> min,
                                                               std::optional<double> max) {
    if (std::isnan(mu) || std::isnan(sigma)) return rdist::constant_sequence(count, rdist::nan);

    if (const auto pinned = collapse_bounds(min, max, generator.options().floating))
        return rdist::constant_sequence(count, *pinned);

    sigma = std::max(rdist::nearly_zero, sigma);

    return sequence<double>(count, [&generator, mu, sigma, min, max] {
        double value;
        do {
            double u;
            do { u = generator.next_double(); } while (rdist::is_nearly_zero(u * (1 - u)));

            value = mu + sigma * std::log(u / (1 - u));
        } while ((min && value < *min) || (max && value > *max));

        return value;
    });
}
