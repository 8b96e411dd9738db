// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Version, build platform & copyright info.
// _________________________________________________________________________________

#pragma once

#include <string>

#include <UTL/predef.hpp>


namespace rdist {

struct version {
    constexpr static int major = 0;
    constexpr static int minor = 1;
    constexpr static int patch = 0;

    constexpr static auto program      = "rdist";
    constexpr static auto platform     = utl::predef::platform_name;
    constexpr static auto architecture = utl::predef::architecture_name;

    constexpr static auto copyright = "Copyright (c) 2025 rdist contributors";

    static std::string format_semantic();
    static std::string format_full();
};

} // namespace rdist
