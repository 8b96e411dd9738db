// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/version.hpp"

#include <fmt/format.h>


std::string rdist::version::format_semantic() { return fmt::format("{}.{}.{}", major, minor, patch); }

std::string rdist::version::format_full() {
    return fmt::format(                    //
        "{} version {}.{}.{} ({} {})\n{}", //
        program,                           //
        major, minor, patch,               //
        platform, architecture,            //
        copyright                          //
    );                                     //
}
