// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/math.hpp"

#include <algorithm>
#include <array>
#include <bit>

#include "utility/error_messages.hpp"
#include "utility/exception.hpp"


bool rdist::is_nearly_equal(double a, double b) noexcept {
    if (a == b) return true; // also covers equal infinities
    if (std::isnan(a) || std::isnan(b) || std::isinf(a) || std::isinf(b)) return false;

    const double difference = std::abs(a - b);
    const double magnitude  = std::max(std::abs(a), std::abs(b));

    return difference < rdist::nearly_zero || difference <= rdist::nearly_zero * magnitude;
}

bool rdist::is_same_value(double a, double b) noexcept {
    if (std::isnan(a) && std::isnan(b)) return true;
    return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

double rdist::round_to_precision(double value, std::uint8_t precision) noexcept {
    if (!std::isfinite(value) || precision > std::numeric_limits<double>::digits10) return value;

    constexpr auto powers = [] {
        std::array<double, std::numeric_limits<double>::digits10 + 1> result{};
        double                                                        power = 1.0;
        for (auto& e : result) {
            e = power;
            power *= 10.0;
        }
        return result;
    }();

    const double scale  = powers[precision];
    const double scaled = value * scale;

    if (!std::isfinite(scaled)) return value;

    return std::round(scaled) / scale;
}

std::vector<double> rdist::normalize_weights(std::span<const double> weights) {
    if (weights.empty()) return std::vector<double>(3, 1.0 / 3.0);

    std::vector<double> normalized(weights.begin(), weights.end());

    double total = 0;
    for (auto& weight : normalized) {
        if (weight < 0) weight = 0; // NaN weights are left as-is and propagate
        total += weight;
    }

    if (rdist::is_nearly_zero(total))
        throw rdist::domain_error{"{} Got {} weights summing to {{ {} }}.",
                                  rdist::error_message(error_kind::total_weight_is_zero), normalized.size(), total};

    if (!rdist::is_nearly_equal(total, 1.0))
        for (auto& weight : normalized) weight /= total;

    return normalized;
}

bool rdist::has_nonzero_total_weight(std::span<const double> weights) noexcept {
    if (weights.empty()) return true;

    double total = 0;
    for (const double weight : weights) total += (weight < 0) ? 0 : weight;

    return !rdist::is_nearly_zero(total);
}
