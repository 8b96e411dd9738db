// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/normal.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "distribution/bounds.hpp"
#include "utility/math.hpp"


rdist::distribution_properties rdist::distribution::normal::properties(double mu, double sigma) {
    if (std::isnan(mu) || std::isnan(sigma)) return distribution_properties::undefined();

    sigma = std::max(rdist::nearly_zero, sigma);

    return {
        .maximum  = rdist::inf,
        .mean     = mu,
        .median   = mu,
        .minimum  = -rdist::inf,
        .mode     = {mu},
        .variance = rdist::square(sigma),
    };
}

rdist::sequence<double> rdist::distribution::normal::samples(random_generator& generator, std::ptrdiff_t count,
                                                             double mu, double sigma, std::optional<double> min,
                                                             std::optional<double> max) {
    if (std::isnan(mu) || std::isnan(sigma)) return rdist::constant_sequence(count, rdist::nan);

    if (const auto pinned = collapse_bounds(min, max, generator.options().floating))
        return rdist::constant_sequence(count, *pinned);

    sigma = std::max(rdist::nearly_zero, sigma);

    const auto out_of_bounds = [=](double z) { return (min && z < *min) || (max && z > *max); };

    // Second value of each pair is held back for the next call
    return sequence<double>(count, [&generator, mu, sigma, out_of_bounds, pending = std::optional<double>{}]() mutable {
        if (pending) return *std::exchange(pending, std::nullopt);

        double z0, z1;
        do {
            const auto [u, v] = deviation_pair(generator, sigma);
            z0                = mu + u;
            z1                = mu + v;
        } while (out_of_bounds(z0) || out_of_bounds(z1));

        pending = z1;
        return z0;
    });
}

std::pair<double, double> rdist::distribution::normal::deviation_pair(random_generator& generator, double sigma) {
    double u, v, s;
    do {
        u = generator.next_double(-1, 1);
        v = generator.next_double(-1, 1);
        s = rdist::square(u) + rdist::square(v);
    } while (rdist::is_nearly_zero(s) || s >= 1);

    const double factor = std::sqrt(-2 * std::log(s) / s) * sigma;

    return {u * factor, v * factor};
}
