// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/log_normal.hpp"

#include <algorithm>
#include <cmath>

#include "distribution/bounds.hpp"
#include "distribution/normal.hpp"
#include "utility/math.hpp"


rdist::distribution_properties rdist::distribution::log_normal::properties(double mu, double sigma) {
    if (std::isnan(mu) || std::isnan(sigma)) return distribution_properties::undefined();

    sigma = std::max(rdist::nearly_zero, sigma);

    const double sigma_sq = rdist::square(sigma);

    return {
        .maximum  = rdist::inf,
        .mean     = std::exp(mu + sigma_sq / 2),
        .median   = std::exp(mu),
        .minimum  = 0,
        .mode     = {std::exp(mu - sigma_sq)},
        .variance = std::expm1(sigma_sq) * std::exp(2 * mu + sigma_sq),
    };
}

rdist::sequence<double> rdist::distribution::log_normal::samples(random_generator& generator, std::ptrdiff_t count,
                                                                 double mu, double sigma, std::optional<double> min,
                                                                 std::optional<double> max) {
    if (std::isnan(mu) || std::isnan(sigma)) return rdist::constant_sequence(count, rdist::nan);

    if (max && (rdist::is_nearly_zero(*max) || *max < 0)) return rdist::constant_sequence(count, 0.0);

    // Inverted ranges are resolved on the linear scale, 'exp()' of a pinned log-value would be off
    if (const auto pinned = collapse_bounds(min, max, generator.options().floating))
        return rdist::constant_sequence(count, *pinned);

    const std::optional<double> log_min = (min && *min > 0) ? std::optional{std::log(*min)} : std::nullopt;
    const std::optional<double> log_max = max ? std::optional{std::log(*max)} : std::nullopt;

    return rdist::transform(normal::samples(generator, count, mu, sigma, log_min, log_max),
                            [](double x) { return std::exp(x); });
}
