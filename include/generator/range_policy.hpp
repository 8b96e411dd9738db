// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Policies deciding what a bounded draw does when 'min > max'. Generators carry
// a 'range_options' value explicitly, there is no process-wide policy state.
// _________________________________________________________________________________

#pragma once

#include <concepts>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include "utility/error_messages.hpp"
#include "utility/exception.hpp"


namespace rdist {

enum class floating_range_policy {
    min_bound, // return the minimum bound (default)
    zero,      // return zero
    max_bound, // return the maximum bound
    swap,      // swap the bounds and draw
    exception, // throw 'rdist::domain_error'
    nan        // return NaN
};

enum class integral_range_policy {
    min_bound, // return the minimum bound (default)
    zero,      // return zero
    max_bound, // return the maximum bound
    swap,      // swap the bounds and draw
    exception  // throw 'rdist::domain_error'
};

struct range_options {
    floating_range_policy floating = floating_range_policy::min_bound;
    integral_range_policy integral = integral_range_policy::min_bound;

    bool operator==(const range_options&) const = default;
};

// --- Name lookup ---
// -------------------

[[nodiscard]] floating_range_policy floating_range_policy_from_name(std::string_view name);
[[nodiscard]] integral_range_policy integral_range_policy_from_name(std::string_view name);

[[nodiscard]] std::string_view to_name(floating_range_policy policy);
[[nodiscard]] std::string_view to_name(integral_range_policy policy);

// --- Policy application ---
// --------------------------

// When 'min > max' applies the policy: returns a value if the policy decides the result outright,
// swaps the bounds in place for 'swap' and returns nothing, throws for 'exception'.
// Ordered ranges are left untouched.
template <class T>
[[nodiscard]] std::optional<T> apply_range_policy(T& min, T& max, integral_range_policy policy) {
    if (!(min > max)) return std::nullopt;

    switch (policy) {
    case integral_range_policy::min_bound: return min;
    case integral_range_policy::zero: return T{};
    case integral_range_policy::max_bound: return max;
    case integral_range_policy::swap: std::swap(min, max); return std::nullopt;
    case integral_range_policy::exception:
        throw rdist::domain_error{"{} Got range {{ {}, {} }}.", rdist::error_message(error_kind::min_above_max), min,
                                  max};
    }

    std::unreachable();
}

template <std::floating_point T>
[[nodiscard]] std::optional<T> apply_range_policy(T& min, T& max, floating_range_policy policy) {
    if (!(min > max)) return std::nullopt;

    switch (policy) {
    case floating_range_policy::min_bound: return min;
    case floating_range_policy::zero: return T{};
    case floating_range_policy::max_bound: return max;
    case floating_range_policy::swap: std::swap(min, max); return std::nullopt;
    case floating_range_policy::exception:
        throw rdist::domain_error{"{} Got range {{ {}, {} }}.", rdist::error_message(error_kind::min_above_max), min,
                                  max};
    case floating_range_policy::nan: return std::numeric_limits<T>::quiet_NaN();
    }

    std::unreachable();
}

} // namespace rdist
