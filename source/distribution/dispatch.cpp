// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/dispatch.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

#include "distribution/binomial.hpp"
#include "distribution/categorical.hpp"
#include "distribution/exponential.hpp"
#include "distribution/log_normal.hpp"
#include "distribution/logistic.hpp"
#include "distribution/normal.hpp"
#include "distribution/positive_normal.hpp"
#include "utility/math.hpp"


template <class Int>
[[nodiscard]] Int truncate_bound(double bound) {
    constexpr double lowest  = std::numeric_limits<Int>::min();
    constexpr double highest = std::numeric_limits<Int>::max();

    if (std::isnan(bound)) return Int{};
    return static_cast<Int>(std::clamp(std::trunc(bound), lowest, highest));
}

[[nodiscard]] rdist::distribution_properties discrete_uniform_properties(double a, double b) {
    return {
        .maximum  = b,
        .mean     = (a + b) / 2,
        .median   = (a + b) / 2,
        .minimum  = a,
        .mode     = {rdist::nan}, // every value is a mode
        .variance = (rdist::square(b - a + 1) - 1) / 12,
    };
}

[[nodiscard]] rdist::sequence<double> sample_shape(rdist::random_generator&              generator,
                                                   const rdist::distribution_parameters& parameters,
                                                   std::ptrdiff_t                        count) {
    using namespace rdist;

    const auto min = parameters.min();
    const auto max = parameters.max();

    const auto to_double = [](auto x) { return static_cast<double>(x); };

    return std::visit(
        [&](const auto& s) -> sequence<double> {
            using shape_type = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<shape_type, shape::continuous_uniform>) {
                const double a = min.value_or(0);
                const double b = max.value_or(1);
                return sequence<double>(count, [&generator, a, b] { return generator.next_double(a, b); });
            } else if constexpr (std::is_same_v<shape_type, shape::discrete_uniform_signed>) {
                const auto a = min ? truncate_bound<std::int32_t>(*min) : std::numeric_limits<std::int32_t>::min();
                const auto b = max ? truncate_bound<std::int32_t>(*max) : std::numeric_limits<std::int32_t>::max();
                return sequence<double>(count, [&generator, a, b] { return generator.next_int_inclusive(a, b); });
            } else if constexpr (std::is_same_v<shape_type, shape::discrete_uniform_unsigned>) {
                const auto a = min ? truncate_bound<std::uint32_t>(*min) : std::uint32_t{0};
                const auto b = max ? truncate_bound<std::uint32_t>(*max) : std::numeric_limits<std::uint32_t>::max();
                return sequence<double>(count, [&generator, a, b] { return generator.next_uint_inclusive(a, b); });
            } else if constexpr (std::is_same_v<shape_type, shape::binomial>) {
                if (std::isnan(s.p)) return rdist::constant_sequence(count, rdist::nan);
                return rdist::transform(distribution::binomial::samples(generator, count, s.n, s.p), to_double);
            } else if constexpr (std::is_same_v<shape_type, shape::categorical>) {
                return rdist::transform(distribution::categorical::samples(generator, count, s.weights), to_double);
            } else if constexpr (std::is_same_v<shape_type, shape::positive_normal>) {
                return distribution::positive_normal::samples(generator, count, s.mu, s.sigma, max);
            } else if constexpr (std::is_same_v<shape_type, shape::exponential>) {
                return distribution::exponential::samples(generator, count, s.lambda, max);
            } else if constexpr (std::is_same_v<shape_type, shape::log_normal>) {
                return distribution::log_normal::samples(generator, count, s.mu, s.sigma, min, max);
            } else if constexpr (std::is_same_v<shape_type, shape::logistic>) {
                return distribution::logistic::samples(generator, count, s.mu, s.sigma, min, max);
            } else if constexpr (std::is_same_v<shape_type, shape::normal>) {
                return distribution::normal::samples(generator, count, s.mu, s.sigma, min, max);
            }
        },
        parameters.shape());
}

rdist::sequence<double> rdist::sample(random_generator& generator, const distribution_parameters& parameters,
                                      std::ptrdiff_t count) {
    auto samples = sample_shape(generator, parameters, count);

    if (const auto precision = parameters.precision())
        return rdist::transform(std::move(samples), [digits = *precision](double x) {
            return rdist::round_to_precision(x, digits);
        });

    return samples;
}

rdist::distribution_properties rdist::properties(const distribution_parameters& parameters) {
    const auto min = parameters.min();
    const auto max = parameters.max();

    return std::visit(
        [&](const auto& s) -> distribution_properties {
            using shape_type = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<shape_type, shape::continuous_uniform>) {
                const double a = min.value_or(0);
                const double b = max.value_or(1);
                return {
                    .maximum  = b,
                    .mean     = (a + b) / 2,
                    .median   = (a + b) / 2,
                    .minimum  = a,
                    .mode     = {rdist::nan},
                    .variance = rdist::square(b - a) / 12,
                };
            } else if constexpr (std::is_same_v<shape_type, shape::discrete_uniform_signed>) {
                const double a = min ? truncate_bound<std::int32_t>(*min) : std::numeric_limits<std::int32_t>::min();
                const double b = max ? truncate_bound<std::int32_t>(*max) : std::numeric_limits<std::int32_t>::max();
                return discrete_uniform_properties(a, b);
            } else if constexpr (std::is_same_v<shape_type, shape::discrete_uniform_unsigned>) {
                const double a = min ? truncate_bound<std::uint32_t>(*min) : 0;
                const double b = max ? truncate_bound<std::uint32_t>(*max) : std::numeric_limits<std::uint32_t>::max();
                return discrete_uniform_properties(a, b);
            } else if constexpr (std::is_same_v<shape_type, shape::binomial>) {
                return distribution::binomial::properties(s.n, s.p);
            } else if constexpr (std::is_same_v<shape_type, shape::categorical>) {
                return distribution::categorical::properties(s.weights);
            } else if constexpr (std::is_same_v<shape_type, shape::positive_normal>) {
                return distribution::positive_normal::properties(s.mu, s.sigma);
            } else if constexpr (std::is_same_v<shape_type, shape::exponential>) {
                return distribution::exponential::properties(s.lambda);
            } else if constexpr (std::is_same_v<shape_type, shape::log_normal>) {
                return distribution::log_normal::properties(s.mu, s.sigma);
            } else if constexpr (std::is_same_v<shape_type, shape::logistic>) {
                return distribution::logistic::properties(s.mu, s.sigma);
            } else if constexpr (std::is_same_v<shape_type, shape::normal>) {
                return distribution::normal::properties(s.mu, s.sigma);
            }
        },
        parameters.shape());
}
