// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "distribution/bounds.hpp"

#include "utility/math.hpp"


std::optional<double> rdist::distribution::collapse_bounds(std::optional<double>& min, std::optional<double>& max,
                                                           floating_range_policy policy) {
    if (!min || !max) return std::nullopt;

    if (rdist::is_nearly_equal(*min, *max)) return *min;

    // 'min_bound', 'zero', 'max_bound' & 'nan' all pin the range to a single value,
    // 'exception' throws, 'swap' reorders the bounds and lets sampling proceed
    if (const auto pinned = rdist::apply_range_policy(*min, *max, policy)) return *pinned;

    return std::nullopt;
}
