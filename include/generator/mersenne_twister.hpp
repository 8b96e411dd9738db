// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// 32-bit Mersenne Twister (MT19937, period 2^19937-1), the raw word source for
// all other generation. Output for a given seed is fixed forever, so sequences
// can be replayed across runs, builds and platforms.
// _________________________________________________________________________________

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>


namespace rdist {

// Satisfies 'std::uniform_random_bit_generator', so it also works with <random> distributions.
//
// Thread safety: word production (including state regeneration) and reseeding are serialized
// by an internal mutex, the lock is held for exactly one state mutation.
class mersenne_twister {
public:
    using result_type = std::uint32_t;

    constexpr static std::size_t state_size = 624;
    constexpr static std::size_t shift_size = 397;

    explicit mersenne_twister(std::uint32_t seed);
    mersenne_twister(); // seeded from 'rdist::new_seed()'

    mersenne_twister(const mersenne_twister&)            = delete;
    mersenne_twister& operator=(const mersenne_twister&) = delete;

    [[nodiscard]] std::uint32_t next_word();

    result_type operator()() { return this->next_word(); }

    [[nodiscard]] constexpr static result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    [[nodiscard]] constexpr static result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    [[nodiscard]] std::uint32_t seed() const;

    void reset(); // re-applies the current seed
    void reset(std::uint32_t seed);

private:
    void regenerate(); // expects the lock to be held

    std::array<std::uint32_t, state_size> state{};
    std::size_t                           index      = state_size;
    std::uint32_t                         seed_value = 0;

    mutable std::mutex mutex;
};

} // namespace rdist
