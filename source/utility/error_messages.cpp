// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/error_messages.hpp"

#include <utility>


std::string_view rdist::error_message(error_kind kind) {
    // clang-format off
    switch (kind) {
    case error_kind::min_above_max       : return "The minimum bound cannot be greater than the maximum bound.";
    case error_kind::null_buffer         : return "Buffer cannot be null.";
    case error_kind::total_weight_is_zero: return "Total weight cannot be zero.";
    case error_kind::unrecognized_format : return "The provided format is unrecognized.";
    case error_kind::unknown_policy      : return "The provided range policy name is unrecognized.";
    case error_kind::invalid_parameters  : return "The provided text does not describe a distribution.";
    }
    // clang-format on

    std::unreachable();
}
