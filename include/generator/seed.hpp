// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Source of non-deterministic seeds for default-constructed generators.
// _________________________________________________________________________________

#pragma once

#include <cstdint>


namespace rdist {

[[nodiscard]] std::uint32_t new_seed();

} // namespace rdist
