// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Uniform derivation layer over the Mersenne Twister. Turns raw 32-bit words
// into booleans, byte buffers, bounded integers and bounded floating values.
//
// Every floating draw uses the top 31 bits of a single word, every method
// consumes a fixed number of words for given arguments, which is what keeps
// sequences reproducible from a seed.
// _________________________________________________________________________________

#pragma once

#include <climits>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

#include "generator/mersenne_twister.hpp"
#include "generator/range_policy.hpp"


namespace rdist {

class random_generator {
public:
    explicit random_generator(range_options options = {}); // entropy seed
    explicit random_generator(std::uint32_t seed, range_options options = {});

    random_generator(const random_generator&)            = delete;
    random_generator& operator=(const random_generator&) = delete;

    // --- Floating ---
    // ----------------

    // '[0, 1)'
    template <std::floating_point T>
    [[nodiscard]] T next() {
        const auto bits   = static_cast<std::int32_t>(this->next_word() >> 1);
        const T    result = static_cast<T>(bits) * (T{1} / (static_cast<T>(INT_MAX) + T{1}));
        return result < T{1} ? result : std::nextafter(T{1}, T{0}); // narrow types can round up to 1
    }

    [[nodiscard]] double next_double();
    [[nodiscard]] double next_double(double max);             // '[0, max)', NaN -> NaN, infinity -> itself
    [[nodiscard]] double next_double(double min, double max); // '[min, max)', inverted range -> floating policy

    // High precision counterparts, inverted ranges follow the integral policy
    [[nodiscard]] long double next_decimal();
    [[nodiscard]] long double next_decimal(long double max);
    [[nodiscard]] long double next_decimal(long double min, long double max);

    // --- Integral ---
    // ----------------

    [[nodiscard]] bool next_bool();

    void next_bytes(std::span<std::uint8_t> buffer);
    void next_bytes(std::uint8_t* buffer, std::size_t size); // null buffer of non-zero size throws

    [[nodiscard]] std::int32_t next_int();                                   // '[0, INT_MAX)'
    [[nodiscard]] std::int32_t next_int(std::int32_t max);                   // '[0, max)'
    [[nodiscard]] std::int32_t next_int(std::int32_t min, std::int32_t max); // '[min, max)'

    [[nodiscard]] std::int32_t next_int_inclusive();                 // '[0, INT_MAX]'
    [[nodiscard]] std::int32_t next_int_inclusive(std::int32_t max); // '[0, max]'
    [[nodiscard]] std::int32_t next_int_inclusive(std::int32_t min, std::int32_t max);

    [[nodiscard]] std::uint32_t next_uint();                                     // '[0, UINT_MAX)'
    [[nodiscard]] std::uint32_t next_uint(std::uint32_t max);                    // '[0, max)'
    [[nodiscard]] std::uint32_t next_uint(std::uint32_t min, std::uint32_t max); // '[min, max)'

    [[nodiscard]] std::uint32_t next_uint_inclusive();                  // '[0, UINT_MAX]'
    [[nodiscard]] std::uint32_t next_uint_inclusive(std::uint32_t max); // '[0, max]'
    [[nodiscard]] std::uint32_t next_uint_inclusive(std::uint32_t min, std::uint32_t max);

    [[nodiscard]] std::uint32_t next_word(); // raw tempered word

    // --- State ---
    // -------------

    [[nodiscard]] std::uint32_t seed() const;

    void reset(); // re-applies the current seed, clears the boolean cache
    void reset(std::uint32_t seed);

    [[nodiscard]] range_options options() const;
    void                        set_options(range_options options);

private:
    mersenne_twister engine;

    mutable std::mutex policy_mutex; // never held while drawing
    range_options      policies;

    std::mutex    bit_mutex; // lock order: 'bit_mutex' before the engine mutex
    std::uint32_t bit_buffer = 0;
    int           bit_count  = 0; // bits left in 'bit_buffer' after the current one
};

} // namespace rdist
