// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "generator/random_generator.hpp"

#include <limits>

#include "utility/error_messages.hpp"
#include "utility/exception.hpp"


constexpr double int_range  = static_cast<double>(INT_MAX) + 1.0;  // 2^31
constexpr double uint_range = static_cast<double>(UINT_MAX) + 1.0; // 2^32

rdist::random_generator::random_generator(range_options options) : policies(options) {}

rdist::random_generator::random_generator(std::uint32_t seed, range_options options)
    : engine(seed), policies(options) {}

// --- Floating ---
// ----------------

double rdist::random_generator::next_double() { return this->next<double>(); }

double rdist::random_generator::next_double(double max) {
    if (std::isnan(max)) return max;
    if (std::isinf(max)) return max;

    return this->next_double() * max;
}

double rdist::random_generator::next_double(double min, double max) {
    if (std::isnan(min) || std::isnan(max)) return std::numeric_limits<double>::quiet_NaN();

    if (const auto decided = rdist::apply_range_policy(min, max, this->options().floating)) return *decided;

    if (std::isinf(min)) {
        if (!std::isinf(max)) return min;
        if (std::signbit(min) == std::signbit(max)) return min;

        return this->next_bool() ? std::numeric_limits<double>::infinity()
                                 : -std::numeric_limits<double>::infinity();
    }

    if (std::isinf(max)) return max;

    return min + this->next_double() * (max - min);
}

long double rdist::random_generator::next_decimal() { return this->next<long double>(); }

long double rdist::random_generator::next_decimal(long double max) { return this->next_decimal() * max; }

long double rdist::random_generator::next_decimal(long double min, long double max) {
    if (const auto decided = rdist::apply_range_policy(min, max, this->options().integral)) return *decided;

    return min + this->next_decimal() * (max - min);
}

// --- Integral ---
// ----------------

bool rdist::random_generator::next_bool() {
    const std::lock_guard lock(this->bit_mutex);

    if (this->bit_count == 0) {
        this->bit_buffer = this->next_uint();
        this->bit_count  = 31;
        return this->bit_buffer & 1u;
    }

    --this->bit_count;
    this->bit_buffer >>= 1;
    return this->bit_buffer & 1u;
}

void rdist::random_generator::next_bytes(std::span<std::uint8_t> buffer) {
    const std::size_t size = buffer.size();

    std::size_t i = 0;

    // Whole words
    for (; i + 4 <= size; i += 4) {
        const std::uint32_t word = this->next_uint();

        buffer[i + 0] = static_cast<std::uint8_t>(word);
        buffer[i + 1] = static_cast<std::uint8_t>(word >> 8);
        buffer[i + 2] = static_cast<std::uint8_t>(word >> 16);
        buffer[i + 3] = static_cast<std::uint8_t>(word >> 24);
    }

    // Tail of 1-3 bytes still consumes a full word, the rest of it is discarded
    if (i < size) {
        const std::uint32_t word = this->next_uint();

        for (unsigned shift = 0; i < size; ++i, shift += 8) buffer[i] = static_cast<std::uint8_t>(word >> shift);
    }
}

void rdist::random_generator::next_bytes(std::uint8_t* buffer, std::size_t size) {
    if (!buffer && size) throw rdist::domain_error{rdist::error_message(error_kind::null_buffer)};

    if (size) this->next_bytes(std::span<std::uint8_t>{buffer, size});
}

std::int32_t rdist::random_generator::next_int() {
    std::int32_t result;
    do { result = this->next_int_inclusive(); } while (result == INT_MAX);
    return result;
}

std::int32_t rdist::random_generator::next_int(std::int32_t max) {
    return static_cast<std::int32_t>(this->next_double() * max);
}

std::int32_t rdist::random_generator::next_int(std::int32_t min, std::int32_t max) {
    if (const auto decided = rdist::apply_range_policy(min, max, this->options().integral)) return *decided;

    // Width can reach 2^32 - 1, so the offset is computed in 64 bits
    const double width  = static_cast<double>(max) - static_cast<double>(min);
    const auto   offset = static_cast<std::int64_t>(this->next_double() * width);

    return static_cast<std::int32_t>(min + offset);
}

std::int32_t rdist::random_generator::next_int_inclusive() { return static_cast<std::int32_t>(this->next_word() >> 1); }

std::int32_t rdist::random_generator::next_int_inclusive(std::int32_t max) {
    if (max == 0) return 0;
    if (max == INT_MAX) return static_cast<std::int32_t>(this->next_double() * int_range);

    // widen away from zero so 'max' itself becomes reachable, doubles avoid overflow at 'INT_MIN'
    const double widened = max < 0 ? max - 1.0 : max + 1.0;
    return static_cast<std::int32_t>(this->next_double() * widened);
}

std::int32_t rdist::random_generator::next_int_inclusive(std::int32_t min, std::int32_t max) {
    if (const auto decided = rdist::apply_range_policy(min, max, this->options().integral)) return *decided;

    // Width of '[INT_MIN, INT_MAX]' is 2^32, so the offset is computed in 64 bits
    const double width  = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    const auto   offset = static_cast<std::int64_t>(this->next_double() * width);

    return static_cast<std::int32_t>(min + offset);
}

std::uint32_t rdist::random_generator::next_uint() {
    std::uint32_t result;
    do { result = this->next_uint_inclusive(); } while (result == UINT_MAX);
    return result;
}

std::uint32_t rdist::random_generator::next_uint(std::uint32_t max) {
    return static_cast<std::uint32_t>(this->next_double() * max);
}

std::uint32_t rdist::random_generator::next_uint(std::uint32_t min, std::uint32_t max) {
    if (const auto decided = rdist::apply_range_policy(min, max, this->options().integral)) return *decided;

    return min + static_cast<std::uint32_t>(this->next_double() * (max - static_cast<double>(min)));
}

std::uint32_t rdist::random_generator::next_uint_inclusive() { return this->next_word(); }

std::uint32_t rdist::random_generator::next_uint_inclusive(std::uint32_t max) {
    if (max == 0) return 0;
    if (max == UINT_MAX) return static_cast<std::uint32_t>(this->next_double() * uint_range);

    return this->next_uint(max + 1);
}

std::uint32_t rdist::random_generator::next_uint_inclusive(std::uint32_t min, std::uint32_t max) {
    if (const auto decided = rdist::apply_range_policy(min, max, this->options().integral)) return *decided;

    if (min == 0 && max == UINT_MAX) return this->next_uint_inclusive();

    const double width = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return min + static_cast<std::uint32_t>(this->next_double() * width);
}

std::uint32_t rdist::random_generator::next_word() { return this->engine.next_word(); }

// --- State ---
// -------------

std::uint32_t rdist::random_generator::seed() const { return this->engine.seed(); }

void rdist::random_generator::reset() { this->reset(this->seed()); }

void rdist::random_generator::reset(std::uint32_t seed) {
    {
        const std::lock_guard lock(this->bit_mutex);

        this->bit_buffer = 0;
        this->bit_count  = 0;
    }
    this->engine.reset(seed);
}

rdist::range_options rdist::random_generator::options() const {
    const std::lock_guard lock(this->policy_mutex);
    return this->policies;
}

void rdist::random_generator::set_options(range_options options) {
    const std::lock_guard lock(this->policy_mutex);
    this->policies = options;
}
