// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/exponential.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "utility/math.hpp"


rdist::distribution_properties rdist::distribution::exponential::properties(double lambda) {
    if (std::isnan(lambda)) return distribution_properties::undefined();

    lambda = std::max(rdist::nearly_zero, lambda);

    return {
        .maximum  = rdist::inf,
        .mean     = 1 / lambda,
        .median   = std::numbers::ln2 / lambda,
        .minimum  = 0,
        .mode     = {0.0},
        .variance = 1 / rdist::square(lambda),
    };
}

rdist::sequence<double> rdist::distribution::exponential::samples(random_generator& generator, std::ptrdiff_t count,
                                                                  double lambda, std::optional<double> max) {
    if (std::isnan(lambda)) return rdist::constant_sequence(count, rdist::nan);

    if (max && (rdist::is_nearly_zero(*max) || *max < 0)) return rdist::constant_sequence(count, 0.0);

    lambda = std::max(rdist::nearly_zero, lambda);

    return sequence<double>(count, [&generator, lambda, max] {
        double value;
        do {
            double u;
            do { u = generator.next_double(); } while (rdist::is_nearly_zero(u));

            value = -std::log(u) / lambda;
        } while (max && value > *max);

        return value;
    });
}
