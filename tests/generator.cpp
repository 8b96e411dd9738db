#include "common.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <bit>
#include <limits>
#include <random>
#include <thread>
#include <vector>

#include "generator/mersenne_twister.hpp"
#include "generator/random_generator.hpp"
#include "generator/range_policy.hpp"


static_assert(std::uniform_random_bit_generator<rdist::mersenne_twister>);

// 'std::mt19937' implements the same reference algorithm, so it serves as an oracle
TEST_CASE("Mersenne twister / Reference output") {
    rdist::mersenne_twister engine(5489);

    CHECK(engine.next_word() == 3499211612u);
    CHECK(engine.next_word() == 581869302u);
    CHECK(engine.next_word() == 3890346734u);
    CHECK(engine.next_word() == 3586334585u);
    CHECK(engine.next_word() == 545404204u);
}

TEST_CASE("Mersenne twister / Matches std::mt19937 across regenerations") {
    for (const std::uint32_t seed : {0u, 1u, 42u, 5489u, 0xffffffffu}) {
        rdist::mersenne_twister engine(seed);
        std::mt19937            oracle(seed);

        // 2000 words cover several full state regenerations
        for (int i = 0; i < 2000; ++i) REQUIRE(engine() == oracle());
    }
}

TEST_CASE("Mersenne twister / Reset replays the sequence") {
    rdist::mersenne_twister engine(123);

    std::vector<std::uint32_t> first;
    for (int i = 0; i < 700; ++i) first.push_back(engine.next_word());

    engine.reset();
    CHECK(engine.seed() == 123);
    for (int i = 0; i < 700; ++i) REQUIRE(engine.next_word() == first[i]);

    engine.reset(77);
    CHECK(engine.seed() == 77);

    rdist::mersenne_twister other(77);
    for (int i = 0; i < 10; ++i) REQUIRE(engine.next_word() == other.next_word());
}

TEST_CASE("Random generator / Equal seeds give equal sequences") {
    rdist::random_generator a(2024);
    rdist::random_generator b(2024);

    for (int i = 0; i < 1000; ++i) {
        REQUIRE(a.next_double() == b.next_double());
        REQUIRE(a.next_int(-50, 50) == b.next_int(-50, 50));
        REQUIRE(a.next_bool() == b.next_bool());
        REQUIRE(a.next_uint_inclusive(7) == b.next_uint_inclusive(7));
    }
}

TEST_CASE("Random generator / Unit interval uses top 31 bits") {
    rdist::random_generator generator(5489);
    std::mt19937            oracle(5489);

    for (int i = 0; i < 100; ++i) {
        const double expected = static_cast<double>(oracle() >> 1) / 2147483648.0;
        REQUIRE(generator.next_double() == expected);
    }

    rdist::random_generator floats(1);
    for (int i = 0; i < 10000; ++i) {
        const float value = floats.next<float>();
        REQUIRE(value >= 0.0f);
        REQUIRE(value < 1.0f);
    }
}

TEST_CASE("Random generator / Range containment") {
    rdist::random_generator generator(99);

    for (int i = 0; i < 10000; ++i) {
        const double d = generator.next_double(-3.5, 12.25);
        REQUIRE(d >= -3.5);
        REQUIRE(d < 12.25);

        const std::int32_t n = generator.next_int(-20, 20);
        REQUIRE(n >= -20);
        REQUIRE(n < 20);

        const std::uint32_t u = generator.next_uint(10, 15);
        REQUIRE(u >= 10);
        REQUIRE(u < 15);

        const std::int32_t ni = generator.next_int_inclusive(-3, 3);
        REQUIRE(ni >= -3);
        REQUIRE(ni <= 3);

        const std::uint32_t ui = generator.next_uint_inclusive(5);
        REQUIRE(ui <= 5);

        REQUIRE(generator.next_int() < INT_MAX);
        REQUIRE(generator.next_uint() < UINT_MAX);
    }

    // Ranges wider than 2^31 stay inside the bounds and cover both signs
    int full_negative = 0;
    int wide_negative = 0;

    for (int i = 0; i < 100000; ++i) {
        const std::int32_t full = generator.next_int(INT_MIN, INT_MAX);
        REQUIRE(full < INT_MAX);
        full_negative += (full < 0);

        const std::int32_t wide = generator.next_int(-10, INT_MAX);
        REQUIRE(wide >= -10);
        REQUIRE(wide < INT_MAX);
        wide_negative += (wide < 0);
    }

    CHECK(full_negative > 48500);
    CHECK(full_negative < 51500);
    CHECK(wide_negative < 10);
}

TEST_CASE("Random generator / Inclusive bounds are reachable") {
    rdist::random_generator generator(7);

    bool seen_min = false;
    bool seen_max = false;

    for (int i = 0; i < 10000; ++i) {
        const std::int32_t n = generator.next_int_inclusive(-2, 2);
        seen_min |= (n == -2);
        seen_max |= (n == 2);
    }

    CHECK(seen_min);
    CHECK(seen_max);

    // Full ranges don't overflow
    for (int i = 0; i < 1000; ++i) {
        [[maybe_unused]] const auto s = generator.next_int_inclusive(INT_MIN, INT_MAX);
        [[maybe_unused]] const auto u = generator.next_uint_inclusive(0, UINT_MAX);
        REQUIRE(generator.next_int_inclusive(INT_MAX) >= 0);
    }

    CHECK(generator.next_int_inclusive(0) == 0);
    CHECK(generator.next_uint_inclusive(0u) == 0u);
}

TEST_CASE("Random generator / Integral range policies") {
    using rdist::integral_range_policy;

    const auto draw = [](integral_range_policy policy) {
        rdist::random_generator generator(1, {.integral = policy});
        return generator.next_int(5, 2);
    };

    CHECK(draw(integral_range_policy::min_bound) == 5);
    CHECK(draw(integral_range_policy::zero) == 0);
    CHECK(draw(integral_range_policy::max_bound) == 2);

    rdist::random_generator swapping(1, {.integral = integral_range_policy::swap});
    for (int i = 0; i < 1000; ++i) {
        const std::int32_t n = swapping.next_int(5, 2);
        REQUIRE(n >= 2);
        REQUIRE(n < 5);
    }

    CHECK_THROWS_AS(draw(integral_range_policy::exception), rdist::domain_error);
    CHECK_THROWS_AS(draw(integral_range_policy::exception), rdist::exception);

    // Inclusive variant resolves the policy before widening the range
    rdist::random_generator inclusive(1, {.integral = integral_range_policy::max_bound});
    CHECK(inclusive.next_int_inclusive(5, 2) == 2);
    CHECK(inclusive.next_uint_inclusive(9u, 4u) == 4u);

    // Decimal draws follow the integral policy
    rdist::random_generator decimal(1, {.integral = integral_range_policy::zero});
    CHECK(decimal.next_decimal(3.0L, 1.0L) == 0.0L);
}

TEST_CASE("Random generator / Floating range policies") {
    using rdist::floating_range_policy;

    const auto draw = [](floating_range_policy policy) {
        rdist::random_generator generator(1, {.floating = policy});
        return generator.next_double(5.0, 2.0);
    };

    CHECK(draw(floating_range_policy::min_bound) == 5.0);
    CHECK(draw(floating_range_policy::zero) == 0.0);
    CHECK(draw(floating_range_policy::max_bound) == 2.0);
    CHECK(std::isnan(draw(floating_range_policy::nan)));
    CHECK_THROWS_AS(draw(floating_range_policy::exception), rdist::domain_error);

    const double swapped = draw(floating_range_policy::swap);
    CHECK(swapped >= 2.0);
    CHECK(swapped < 5.0);

    rdist::random_generator generator(3);
    generator.set_options({.floating = floating_range_policy::max_bound});
    CHECK(generator.options().floating == floating_range_policy::max_bound);
    CHECK(generator.next_double(1.0, 0.0) == 0.0);
}

TEST_CASE("Random generator / Non-finite floating bounds") {
    constexpr double inf = std::numeric_limits<double>::infinity();
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    rdist::random_generator generator(11);

    CHECK(std::isnan(generator.next_double(nan)));
    CHECK(std::isnan(generator.next_double(nan, 1.0)));
    CHECK(std::isnan(generator.next_double(0.0, nan)));

    CHECK(generator.next_double(inf) == inf);
    CHECK(generator.next_double(-inf) == -inf);

    CHECK(generator.next_double(inf, inf) == inf);
    CHECK(generator.next_double(-inf, -inf) == -inf);
    CHECK(generator.next_double(-inf, 3.0) == -inf);
    CHECK(generator.next_double(3.0, inf) == inf);

    bool seen_positive = false;
    bool seen_negative = false;
    for (int i = 0; i < 200; ++i) {
        const double value = generator.next_double(-inf, inf);
        REQUIRE(std::isinf(value));
        seen_positive |= (value > 0);
        seen_negative |= (value < 0);
    }
    CHECK(seen_positive);
    CHECK(seen_negative);
}

TEST_CASE("Random generator / Booleans are served bit by bit") {
    rdist::random_generator generator(5489);
    std::mt19937            oracle(5489);

    const std::uint32_t first  = oracle();
    const std::uint32_t second = oracle();

    // One word serves 32 booleans, starting from the lowest bit
    for (int bit = 0; bit < 32; ++bit) REQUIRE(generator.next_bool() == bool((first >> bit) & 1u));

    CHECK(generator.next_bool() == bool(second & 1u));

    // Reset clears the cache
    generator.reset();
    CHECK(generator.next_bool() == bool(first & 1u));
}

TEST_CASE("Random generator / Byte buffers") {
    rdist::random_generator generator(5489);
    std::mt19937            oracle(5489);

    std::array<std::uint8_t, 6> buffer{};
    generator.next_bytes(buffer);

    const std::uint32_t first  = oracle();
    const std::uint32_t second = oracle();

    // Little-endian within each word
    CHECK(buffer[0] == static_cast<std::uint8_t>(first));
    CHECK(buffer[1] == static_cast<std::uint8_t>(first >> 8));
    CHECK(buffer[2] == static_cast<std::uint8_t>(first >> 16));
    CHECK(buffer[3] == static_cast<std::uint8_t>(first >> 24));
    CHECK(buffer[4] == static_cast<std::uint8_t>(second));
    CHECK(buffer[5] == static_cast<std::uint8_t>(second >> 8));

    // The tail consumed a whole word
    CHECK(generator.next_word() == oracle());

    CHECK_THROWS_AS(generator.next_bytes(nullptr, 4), rdist::domain_error);
    CHECK_NOTHROW(generator.next_bytes(nullptr, 0));
}

TEST_CASE("Random generator / Reset replays the sequence") {
    rdist::random_generator generator(31337);

    std::vector<double> first;
    for (int i = 0; i < 100; ++i) first.push_back(generator.next_double());

    generator.reset();
    for (int i = 0; i < 100; ++i) REQUIRE(generator.next_double() == first[i]);

    generator.reset(5489);
    CHECK(generator.seed() == 5489);
    CHECK(generator.next_word() == 3499211612u);
}

TEST_CASE("Random generator / Shared across threads") {
    constexpr int thread_count = 4;
    constexpr int draws        = 5000;

    // Words: every thread gets distinct words, together they cover the single-threaded run
    {
        rdist::random_generator shared(2024);

        std::vector<std::vector<std::uint32_t>> per_thread(thread_count);
        std::vector<std::thread>                threads;

        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back([&shared, &words = per_thread[t]] {
                for (int i = 0; i < draws; ++i) words.push_back(shared.next_word());
            });
        for (auto& thread : threads) thread.join();

        std::vector<std::uint32_t> drawn;
        for (const auto& words : per_thread) drawn.insert(drawn.end(), words.begin(), words.end());

        std::mt19937               oracle(2024);
        std::vector<std::uint32_t> expected(thread_count * draws);
        for (auto& word : expected) word = oracle();

        REQUIRE(drawn.size() == expected.size());

        std::ranges::sort(drawn);
        std::ranges::sort(expected);
        CHECK(drawn == expected);
    }

    // Booleans: whole words are consumed, so the count of 'true' matches the popcount of the run
    {
        rdist::random_generator shared(2025);

        std::vector<int>         per_thread(thread_count, 0);
        std::vector<std::thread> threads;

        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back([&shared, &ones = per_thread[t]] {
                for (int i = 0; i < draws * 32; ++i) ones += shared.next_bool();
            });
        for (auto& thread : threads) thread.join();

        std::mt19937 oracle(2025);

        int expected_ones = 0;
        for (int i = 0; i < thread_count * draws; ++i) expected_ones += std::popcount(oracle());

        int drawn_ones = 0;
        for (const int ones : per_thread) drawn_ones += ones;

        CHECK(drawn_ones == expected_ones);

        // Nothing was left in the cache, the next boolean starts a fresh word
        const std::uint32_t next = oracle();
        CHECK(shared.next_bool() == bool(next & 1u));
    }
}

TEST_CASE("Random generator / Options can change while drawing") {
    rdist::random_generator shared(77);

    // Every draw sees one consistent policy: 'min_bound' first, then 'zero' or 'swap'
    int outside = 0;

    std::thread drawer([&shared, &outside] {
        for (int i = 0; i < 20000; ++i) {
            const std::int32_t value = shared.next_int(5, 2);
            outside += !(value == 0 || value == 5 || (value >= 2 && value < 5));
        }
    });

    for (int i = 0; i < 2000; ++i)
        shared.set_options({.floating = rdist::floating_range_policy::nan,
                            .integral = (i % 2) ? rdist::integral_range_policy::swap
                                                : rdist::integral_range_policy::zero});
    drawer.join();

    CHECK(outside == 0);
    CHECK(shared.options().floating == rdist::floating_range_policy::nan);
}

TEST_CASE("Range policy / Name lookup") {
    using namespace rdist;

    CHECK(floating_range_policy_from_name("nan") == floating_range_policy::nan);
    CHECK(integral_range_policy_from_name("swap") == integral_range_policy::swap);
    CHECK(to_name(floating_range_policy::max_bound) == "max_bound");
    CHECK(to_name(integral_range_policy::exception) == "exception");

    CHECK_THROWS_AS(integral_range_policy_from_name("nan"), rdist::domain_error);
    CHECK_THROWS_AS(floating_range_policy_from_name("MinBound"), rdist::domain_error);
}
