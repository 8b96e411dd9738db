// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "generator/seed.hpp"

#include <UTL/random.hpp>


std::uint32_t rdist::new_seed() {
    return utl::random::entropy();
    // mixes 'std::random_device' with time, heap/stack addresses, CPU counter & thread id,
    // so generators default-constructed on different threads never share a seed
}
