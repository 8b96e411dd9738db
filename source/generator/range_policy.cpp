// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "generator/range_policy.hpp"


rdist::floating_range_policy rdist::floating_range_policy_from_name(std::string_view name) {
    // clang-format off
    if (name == "min_bound") return floating_range_policy::min_bound;
    if (name == "zero"     ) return floating_range_policy::zero     ;
    if (name == "max_bound") return floating_range_policy::max_bound;
    if (name == "swap"     ) return floating_range_policy::swap     ;
    if (name == "exception") return floating_range_policy::exception;
    if (name == "nan"      ) return floating_range_policy::nan      ;
    // clang-format on

    throw rdist::domain_error{"{} Got {{ {} }} for a floating range policy.",
                              rdist::error_message(error_kind::unknown_policy), name};
}

rdist::integral_range_policy rdist::integral_range_policy_from_name(std::string_view name) {
    // clang-format off
    if (name == "min_bound") return integral_range_policy::min_bound;
    if (name == "zero"     ) return integral_range_policy::zero     ;
    if (name == "max_bound") return integral_range_policy::max_bound;
    if (name == "swap"     ) return integral_range_policy::swap     ;
    if (name == "exception") return integral_range_policy::exception;
    // clang-format on

    throw rdist::domain_error{"{} Got {{ {} }} for an integral range policy.",
                              rdist::error_message(error_kind::unknown_policy), name};
}

std::string_view rdist::to_name(floating_range_policy policy) {
    switch (policy) {
    case floating_range_policy::min_bound: return "min_bound";
    case floating_range_policy::zero: return "zero";
    case floating_range_policy::max_bound: return "max_bound";
    case floating_range_policy::swap: return "swap";
    case floating_range_policy::exception: return "exception";
    case floating_range_policy::nan: return "nan";
    }
    std::unreachable();
}

std::string_view rdist::to_name(integral_range_policy policy) {
    switch (policy) {
    case integral_range_policy::min_bound: return "min_bound";
    case integral_range_policy::zero: return "zero";
    case integral_range_policy::max_bound: return "max_bound";
    case integral_range_policy::swap: return "swap";
    case integral_range_policy::exception: return "exception";
    }
    std::unreachable();
}
