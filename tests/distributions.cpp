#include "common.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <vector>

#include "distribution/binomial.hpp"
#include "distribution/categorical.hpp"
#include "distribution/dispatch.hpp"
#include "distribution/exponential.hpp"
#include "distribution/log_normal.hpp"
#include "distribution/logistic.hpp"
#include "distribution/normal.hpp"
#include "distribution/positive_normal.hpp"
#include "distribution/sequence.hpp"
#include "generator/random_generator.hpp"
#include "parameters.hpp"
#include "utility/exception.hpp"
#include "utility/math.hpp"


using namespace rdist;

TEST_CASE("Sequence / Length & exhaustion") {
    int  calls = 0;
    auto seq   = sequence<int>(5, [&] { return ++calls; });

    CHECK(seq.size() == 5);
    CHECK(seq.next() == 1);
    CHECK(seq.size() == 4);

    const std::vector<int> rest = seq.collect();
    CHECK(rest == std::vector<int>{2, 3, 4, 5});
    CHECK(seq.size() == 0);
    CHECK_FALSE(seq.next().has_value());
    CHECK(calls == 5); // nothing is computed past the end

    CHECK(sequence<int>(-3, [] { return 0; }).size() == 0);

    int sum = 0;
    for (const int value : constant_sequence(4, 3)) sum += value;
    CHECK(sum == 12);

    auto doubled = rdist::transform(constant_sequence(3, 21), [](int x) { return x * 2.0; });
    CHECK(doubled.collect() == std::vector<double>{42.0, 42.0, 42.0});
}

TEST_CASE("Categorical / Properties & frequencies") {
    const std::vector<double> weights = {1, 1, 2};

    const auto normalized = rdist::normalize_weights(weights);
    REQUIRE(normalized.size() == 3);
    CHECK(normalized[0] == doctest::Approx(0.25));
    CHECK(normalized[1] == doctest::Approx(0.25));
    CHECK(normalized[2] == doctest::Approx(0.5));

    const auto props = distribution::categorical::properties(weights);
    CHECK(props.minimum == 0);
    CHECK(props.maximum == 2);
    CHECK(props.mean == doctest::Approx(1.25));
    CHECK(props.median == 1);
    CHECK(props.mode == std::vector<double>{2});
    CHECK(props.variance == doctest::Approx(0.6875));

    random_generator generator(42);

    constexpr std::ptrdiff_t count = 100'000;

    std::vector<int> hits(3, 0);
    for (const std::size_t category : distribution::categorical::samples(generator, count, weights)) {
        REQUIRE(category < 3);
        ++hits[category];
    }

    CHECK(hits[0] / double(count) == doctest::Approx(0.25).epsilon(0.04));
    CHECK(hits[2] / double(count) == doctest::Approx(0.5).epsilon(0.02));
}

TEST_CASE("Categorical / Equal categories & bad weights") {
    random_generator generator(3);

    for (const std::size_t category : distribution::categorical::samples(generator, 1000, 4)) REQUIRE(category < 4);

    // Empty weights mean 3 equal categories
    CHECK(distribution::categorical::properties().maximum == 2);
    CHECK(distribution::categorical::properties(0).maximum == 0); // at least 1 category

    CHECK_THROWS_AS(distribution::categorical::samples(generator, 10, std::vector<double>{0, 0}),
                    rdist::domain_error);
    CHECK_THROWS_AS(distribution_parameters::categorical({0, -1}), rdist::domain_error);

    const std::vector<double> cdf = {0.25, 0.5, 1.0};
    CHECK(distribution::categorical::invert_cdf(cdf, 0.0) == 0);
    CHECK(distribution::categorical::invert_cdf(cdf, 0.3) == 1);
    CHECK(distribution::categorical::invert_cdf(cdf, 0.99) == 2);
}

TEST_CASE("Normal / Moments") {
    random_generator generator(2024);

    const auto values = distribution::normal::samples(generator, 100'000, 5, 2).collect();

    CHECK(values.size() == 100'000);
    CHECK(sample_mean(values) == doctest::Approx(5).epsilon(0.01));
    CHECK(sample_variance(values) == doctest::Approx(4).epsilon(0.03));

    // Odd counts are honored exactly even though values come in pairs
    CHECK(distribution::normal::samples(generator, 7).collect().size() == 7);

    const auto props = distribution::normal::properties(5, 2);
    CHECK(props.mean == 5);
    CHECK(props.median == 5);
    CHECK(props.mode == std::vector<double>{5});
    CHECK(props.variance == 4);
}

TEST_CASE("Normal / Bounds") {
    random_generator generator(8);

    for (const double value : distribution::normal::samples(generator, 10'000, 0, 1, -0.5, 1.5)) {
        REQUIRE(value >= -0.5);
        REQUIRE(value <= 1.5);
    }

    // Degenerate range pins the value
    for (const double value : distribution::normal::samples(generator, 100, 0, 1, 3.5, 3.5)) REQUIRE(value == 3.5);

    CHECK(std::isnan(*distribution::normal::samples(generator, 1, rdist::nan, 1).next()));
    CHECK(distribution::normal::properties(rdist::nan, 1).mode.size() == 1);
    CHECK(std::isnan(distribution::normal::properties(rdist::nan, 1).mean));
}

TEST_CASE("Normal / Inverted bounds follow the floating policy") {
    const auto first = [](floating_range_policy policy) {
        random_generator generator(1, {.floating = policy});
        return *distribution::normal::samples(generator, 1, 0, 1, 2.0, -2.0).next();
    };

    CHECK(first(floating_range_policy::min_bound) == 2.0);
    CHECK(first(floating_range_policy::max_bound) == -2.0);
    CHECK(first(floating_range_policy::zero) == 0.0);
    CHECK(std::isnan(first(floating_range_policy::nan)));

    const double swapped = first(floating_range_policy::swap);
    CHECK(swapped >= -2.0);
    CHECK(swapped <= 2.0);

    random_generator strict(1, {.floating = floating_range_policy::exception});
    CHECK_THROWS_AS(distribution::normal::samples(strict, 1, 0, 1, 2.0, -2.0), rdist::domain_error);
}

TEST_CASE("Positive normal / Support") {
    random_generator generator(17);

    for (const double value : distribution::positive_normal::samples(generator, 10'000, 1, 2, 4)) {
        REQUIRE(value >= 1);
        REQUIRE(value <= 4);
    }

    // Maximum at or below the location pins it
    for (const double value : distribution::positive_normal::samples(generator, 10, 1, 2, 0.5)) REQUIRE(value == 1);

    const auto props = distribution::positive_normal::properties(0, 1);
    CHECK(props.minimum == 0);
    CHECK(props.mean == doctest::Approx(std::sqrt(2 / std::numbers::pi)));
    CHECK(props.variance == doctest::Approx(1 - 2 / std::numbers::pi));
}

TEST_CASE("Log-normal / Support") {
    random_generator generator(23);

    for (const double value : distribution::log_normal::samples(generator, 10'000, 0, 0.5)) REQUIRE(value > 0);

    for (const double value : distribution::log_normal::samples(generator, 10'000, 0, 1, 0.5, 2.0)) {
        REQUIRE(value >= 0.5 * (1 - 1e-12));
        REQUIRE(value <= 2.0 * (1 + 1e-12));
    }

    for (const double value : distribution::log_normal::samples(generator, 10, 0, 1, std::nullopt, -1.0))
        REQUIRE(value == 0);

    const auto props = distribution::log_normal::properties(0, 1);
    CHECK(props.median == doctest::Approx(1));
    CHECK(props.mean == doctest::Approx(std::exp(0.5)));
    REQUIRE(props.mode.size() == 1);
    CHECK(props.mode[0] == doctest::Approx(std::exp(-1.0)));
}

TEST_CASE("Logistic / Bounds & properties") {
    random_generator generator(5);

    for (const double value : distribution::logistic::samples(generator, 10'000, 0, 1, -1, 1)) {
        REQUIRE(value >= -1);
        REQUIRE(value <= 1);
    }

    const auto values = distribution::logistic::samples(generator, 100'000, 3, 1).collect();
    CHECK(sample_mean(values) == doctest::Approx(3).epsilon(0.01));

    const auto props = distribution::logistic::properties(0, 1);
    CHECK(props.mean == 0);
    CHECK(props.variance == doctest::Approx(std::numbers::pi * std::numbers::pi / 3));
}

TEST_CASE("Exponential / Bounds & properties") {
    random_generator generator(11);

    const auto values = distribution::exponential::samples(generator, 100'000, 2).collect();
    for (const double value : values) REQUIRE(value >= 0);
    CHECK(sample_mean(values) == doctest::Approx(0.5).epsilon(0.02));

    for (const double value : distribution::exponential::samples(generator, 10'000, 1, 0.25)) {
        REQUIRE(value >= 0);
        REQUIRE(value <= 0.25);
    }

    for (const double value : distribution::exponential::samples(generator, 10, 1, -1.0)) REQUIRE(value == 0);

    const auto props = distribution::exponential::properties(2);
    CHECK(props.mean == doctest::Approx(0.5));
    CHECK(props.median == doctest::Approx(std::numbers::ln2 / 2));
    CHECK(props.variance == doctest::Approx(0.25));
}

TEST_CASE("Binomial / Support & extremes") {
    random_generator generator(9);

    std::vector<double> values;
    for (const std::uint32_t successes : distribution::binomial::samples(generator, 20'000, 10, 0.3)) {
        REQUIRE(successes <= 10);
        values.push_back(successes);
    }
    CHECK(sample_mean(values) == doctest::Approx(3).epsilon(0.02));

    for (const std::uint32_t successes : distribution::binomial::samples(generator, 100, 8, 0.0)) REQUIRE(successes == 0);
    for (const std::uint32_t successes : distribution::binomial::samples(generator, 100, 8, 1.0)) REQUIRE(successes == 8);

    const auto props = distribution::binomial::properties(10, 0.3);
    CHECK(props.mean == doctest::Approx(3));
    CHECK(props.variance == doctest::Approx(2.1));
    CHECK(props.mode == std::vector<double>{3});
    CHECK(std::isnan(props.median));

    CHECK(std::isnan(distribution::binomial::properties(10, rdist::nan).mean));
}

TEST_CASE("Dispatch / Uniform kinds") {
    random_generator generator(77);

    for (const double value : rdist::sample(generator, distribution_parameters{}, 1000)) {
        REQUIRE(value >= 0);
        REQUIRE(value < 1);
    }

    for (const double value : rdist::sample(generator, distribution_parameters::continuous_uniform(-4, -2), 1000)) {
        REQUIRE(value >= -4);
        REQUIRE(value < -2);
    }

    for (const double value : rdist::sample(generator, distribution_parameters::discrete_uniform_signed(-3, 3), 1000)) {
        REQUIRE(value >= -3);
        REQUIRE(value <= 3);
        REQUIRE(value == std::trunc(value));
    }

    for (const double value : rdist::sample(generator, distribution_parameters::discrete_uniform_unsigned(), 1000))
        REQUIRE(value >= 0);

    for (const double value : rdist::sample(generator, distribution_parameters::fixed_int32(7), 10)) REQUIRE(value == 7);
    for (const double value : rdist::sample(generator, distribution_parameters::zero(), 10)) REQUIRE(value == 0);

    const auto props = rdist::properties(distribution_parameters::discrete_uniform_signed(1, 6));
    CHECK(props.mean == doctest::Approx(3.5));
    CHECK(props.variance == doctest::Approx(35.0 / 12));
}

TEST_CASE("Dispatch / Precision rounding & count") {
    random_generator generator(123);

    const auto parameters = distribution_parameters::normal(0, 10, std::nullopt, std::nullopt, 2);
    const auto values     = rdist::sample(generator, parameters, 500).collect();

    CHECK(values.size() == 500);
    for (const double value : values) REQUIRE(value == rdist::round_to_precision(value, 2));

    CHECK(rdist::sample(generator, parameters, 0).collect().empty());
    CHECK(rdist::sample(generator, parameters, -5).collect().empty());

    CHECK(std::isnan(*rdist::sample(generator, distribution_parameters::binomial(4, rdist::nan), 1).next()));
}

TEST_CASE("Dispatch / Same seed gives same samples") {
    const auto parameters = distribution_parameters::log_normal(1, 0.5, 1.0, 10.0);

    random_generator a(555);
    random_generator b(555);

    CHECK(rdist::sample(a, parameters, 200).collect() == rdist::sample(b, parameters, 200).collect());
}
