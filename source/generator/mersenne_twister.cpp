// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "generator/mersenne_twister.hpp"

#include "generator/seed.hpp"


// Algorithm by Makoto Matsumoto and Takuji Nishimura (1997), see
// "Mersenne Twister: A 623-dimensionally equidistributed uniform pseudorandom number generator".

constexpr std::uint32_t upper_mask = 0x80000000u; // most significant bit
constexpr std::uint32_t lower_mask = 0x7fffffffu; // least significant 31 bits
constexpr std::uint32_t matrix_a   = 0x9908b0dfu;

constexpr std::uint32_t seeding_multiplier = 1812433253u;

constexpr std::uint32_t twist(std::uint32_t upper, std::uint32_t lower, std::uint32_t shifted) noexcept {
    const std::uint32_t y = (upper & upper_mask) | (lower & lower_mask);
    return shifted ^ (y >> 1) ^ ((y & 1u) ? matrix_a : 0u);
}

constexpr std::uint32_t temper(std::uint32_t y) noexcept {
    y ^= y >> 11;
    y ^= (y << 7) & 0x9d2c5680u;
    y ^= (y << 15) & 0xefc60000u;
    y ^= y >> 18;
    return y;
}


rdist::mersenne_twister::mersenne_twister(std::uint32_t seed) { this->reset(seed); }

rdist::mersenne_twister::mersenne_twister() : mersenne_twister(rdist::new_seed()) {}

std::uint32_t rdist::mersenne_twister::next_word() {
    std::uint32_t y;
    {
        const std::lock_guard lock(this->mutex);

        if (this->index >= state_size) this->regenerate();
        y = this->state[this->index++];
    }
    return temper(y); // tempering works on a local copy, no need to hold the lock
}

std::uint32_t rdist::mersenne_twister::seed() const {
    const std::lock_guard lock(this->mutex);
    return this->seed_value;
}

void rdist::mersenne_twister::reset() { this->reset(this->seed()); }

void rdist::mersenne_twister::reset(std::uint32_t seed) {
    const std::lock_guard lock(this->mutex);

    this->seed_value = seed;

    this->state[0] = seed;
    for (std::size_t i = 1; i < state_size; ++i) {
        const std::uint32_t prev = this->state[i - 1];
        this->state[i]           = seeding_multiplier * (prev ^ (prev >> 30)) + static_cast<std::uint32_t>(i);
    }

    this->index = state_size; // first draw regenerates the whole block
}

void rdist::mersenne_twister::regenerate() {
    constexpr std::size_t n = state_size;
    constexpr std::size_t m = shift_size;

    auto& mt = this->state;

    std::size_t k = 0;

    // First pass, word 'k' is mixed with word 'k + m'
    for (; k < n - m; ++k) mt[k] = twist(mt[k], mt[k + 1], mt[k + m]);

    // Second pass, 'k + m' wraps around to the (already regenerated) front of the array
    for (; k < n - 1; ++k) mt[k] = twist(mt[k], mt[k + 1], mt[k + m - n]);

    // Last word wraps around completely
    mt[n - 1] = twist(mt[n - 1], mt[0], mt[m - 1]);

    this->index = 0;
}
