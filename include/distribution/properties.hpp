// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Closed-form summary of a distribution, undefined values are NaN.
// _________________________________________________________________________________

#pragma once

#include <vector>

#include "utility/math.hpp"


namespace rdist {

struct distribution_properties {
    double              maximum  = rdist::nan;
    double              mean     = rdist::nan;
    double              median   = rdist::nan;
    double              minimum  = rdist::nan;
    std::vector<double> mode     = {rdist::nan}; // multimodal distributions list every mode
    double              variance = rdist::nan;

    [[nodiscard]] static distribution_properties undefined() { return {}; }
};

} // namespace rdist
