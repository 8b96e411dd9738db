// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/categorical.hpp"

#include <algorithm>

#include "utility/math.hpp"


[[nodiscard]] std::vector<double> equal_weights(std::int32_t k) {
    k = std::max(1, k);
    return std::vector<double>(static_cast<std::size_t>(k), 1.0 / k);
}

[[nodiscard]] std::vector<double> cumulative(std::span<const double> weights) {
    std::vector<double> cdf(weights.size());

    double total = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) cdf[i] = (total += weights[i]);

    return cdf;
}

rdist::distribution_properties rdist::distribution::categorical::properties(const std::vector<double>& weights) {
    const std::vector<double> normalized = rdist::normalize_weights(weights);
    const std::vector<double> cdf        = cumulative(normalized);

    const double total = cdf.back();

    double      mean       = 0;
    double      max_weight = 0;
    std::size_t mode       = 0;

    for (std::size_t i = 0; i < normalized.size(); ++i) {
        mean += normalized[i] * static_cast<double>(i);

        if (normalized[i] > max_weight) {
            max_weight = normalized[i];
            mode       = i;
        }
    }

    double median   = rdist::nan;
    double variance = 0;

    for (std::size_t i = 0; i < normalized.size(); ++i) {
        if (std::isnan(median) && cdf[i] >= total / 2) median = static_cast<double>(i);

        variance += normalized[i] * rdist::square(static_cast<double>(i) - mean);
    }

    return {
        .maximum  = static_cast<double>(normalized.size() - 1),
        .mean     = mean,
        .median   = median,
        .minimum  = 0,
        .mode     = {static_cast<double>(mode)},
        .variance = variance,
    };
}

rdist::distribution_properties rdist::distribution::categorical::properties(std::int32_t k) {
    return properties(equal_weights(k));
}

rdist::sequence<std::size_t> rdist::distribution::categorical::samples(random_generator& generator,
                                                                       std::ptrdiff_t count,
                                                                       const std::vector<double>& weights) {
    auto cdf = cumulative(rdist::normalize_weights(weights)); // throws before any sampling

    return sequence<std::size_t>(count, [&generator, cdf = std::move(cdf)] {
        return invert_cdf(cdf, generator.next_double());
    });
}

rdist::sequence<std::size_t> rdist::distribution::categorical::samples(random_generator& generator,
                                                                       std::ptrdiff_t count, std::int32_t k) {
    return samples(generator, count, equal_weights(k));
}

std::size_t rdist::distribution::categorical::invert_cdf(std::span<const double> cdf, double u) noexcept {
    if (cdf.empty()) return 0;

    std::size_t lo = 0;
    std::size_t hi = cdf.size() - 1;

    while (lo < hi) {
        const std::size_t mid = lo + (hi - lo) / 2;

        if (rdist::is_nearly_equal(u, cdf[mid])) return mid;

        if (u < cdf[mid]) hi = mid;
        else lo = mid + 1;
    }

    return lo;
}
