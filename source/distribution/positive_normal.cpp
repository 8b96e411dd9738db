// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/positive_normal.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

#include "distribution/normal.hpp"
#include "utility/math.hpp"


constexpr double half_normal_median = 0.6744897501960817; // sqrt(2) * erf^-1(1/2)

rdist::distribution_properties rdist::distribution::positive_normal::properties(double mu, double sigma) {
    if (std::isnan(mu) || std::isnan(sigma)) return distribution_properties::undefined();

    sigma = std::max(rdist::nearly_zero, sigma);

    return {
        .maximum  = rdist::inf,
        .mean     = mu + sigma * std::sqrt(2 / std::numbers::pi),
        .median   = mu + sigma * half_normal_median,
        .minimum  = mu,
        .mode     = {mu},
        .variance = rdist::square(sigma) * (1 - 2 / std::numbers::pi),
    };
}

rdist::sequence<double> rdist::distribution::positive_normal::samples(random_generator& generator,
                                                                      std::ptrdiff_t count, double mu, double sigma,
                                                                      std::optional<double> max) {
    if (std::isnan(mu) || std::isnan(sigma)) return rdist::constant_sequence(count, rdist::nan);

    // No room above the mean
    if (max && (rdist::is_nearly_equal(*max, mu) || *max < mu)) return rdist::constant_sequence(count, mu);

    sigma = std::max(rdist::nearly_zero, sigma);

    return sequence<double>(count, [&generator, mu, sigma, max, pending = std::optional<double>{}]() mutable {
        if (pending) return *std::exchange(pending, std::nullopt);

        double z0, z1;
        do {
            const auto [u, v] = normal::deviation_pair(generator, sigma);
            z0                = mu + std::abs(u);
            z1                = mu + std::abs(v);
        } while (max && (z0 > *max || z1 > *max));

        pending = z1;
        return z0;
    });
}
