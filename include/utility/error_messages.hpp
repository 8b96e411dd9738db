// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Lookup table of user-facing error messages keyed by error kind.
// _________________________________________________________________________________

#pragma once

#include <string_view>


namespace rdist {

enum class error_kind {
    min_above_max,
    null_buffer,
    total_weight_is_zero,
    unrecognized_format,
    unknown_policy,
    invalid_parameters
};

[[nodiscard]] std::string_view error_message(error_kind kind);

} // namespace rdist
