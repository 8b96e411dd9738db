// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "parameters.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

#include "utility/math.hpp"


// --- Shape helpers ---
// ---------------------

template <class T>
concept location_scale_shape = requires(T shape) {
    shape.mu;
    shape.sigma;
};

[[nodiscard]] double positive_scale(double scale) {
    return (std::isfinite(scale) && scale <= 0) ? rdist::nearly_zero : scale; // NaN & infinities are kept
}

[[nodiscard]] rdist::distribution_shape normalized(rdist::distribution_shape shape) {
    std::visit(
        [](auto& s) {
            using shape_type = std::decay_t<decltype(s)>;

            if constexpr (location_scale_shape<shape_type>) s.sigma = positive_scale(s.sigma);
            else if constexpr (std::is_same_v<shape_type, rdist::shape::exponential>) s.lambda = positive_scale(s.lambda);
            else if constexpr (std::is_same_v<shape_type, rdist::shape::categorical>)
                s.weights = rdist::normalize_weights(s.weights);
        },
        shape);

    return shape;
}

[[nodiscard]] double average(double a, double b) { return (a + b) / 2; }

// --- Kind lookup ---
// -------------------

std::string_view rdist::distribution_type_name(distribution_type type) {
    // clang-format off
    switch (type) {
    case distribution_type::continuous_uniform       : return "ContinuousUniform";
    case distribution_type::discrete_uniform_signed  : return "DiscreteUniformSigned";
    case distribution_type::discrete_uniform_unsigned: return "DiscreteUniformUnsigned";
    case distribution_type::binomial                 : return "Binomial";
    case distribution_type::categorical              : return "Categorical";
    case distribution_type::positive_normal          : return "PositiveNormal";
    case distribution_type::exponential              : return "Exponential";
    case distribution_type::log_normal               : return "LogNormal";
    case distribution_type::logistic                 : return "Logistic";
    case distribution_type::normal                   : return "Normal";
    }
    // clang-format on

    std::unreachable();
}

std::optional<rdist::distribution_type> rdist::distribution_type_from_name(std::string_view name) {
    for (std::size_t i = 0; i < distribution_type_count; ++i) {
        const auto type = static_cast<distribution_type>(i);
        if (rdist::distribution_type_name(type) == name) return type;
    }
    return std::nullopt;
}

std::optional<rdist::distribution_type> rdist::distribution_type_from_index(std::size_t index) {
    if (index >= distribution_type_count) return std::nullopt;
    return static_cast<distribution_type>(index);
}

rdist::distribution_shape rdist::default_shape(distribution_type type) {
    switch (type) {
    case distribution_type::continuous_uniform: return shape::continuous_uniform{};
    case distribution_type::discrete_uniform_signed: return shape::discrete_uniform_signed{};
    case distribution_type::discrete_uniform_unsigned: return shape::discrete_uniform_unsigned{};
    case distribution_type::binomial: return shape::binomial{};
    case distribution_type::categorical: return shape::categorical{};
    case distribution_type::positive_normal: return shape::positive_normal{};
    case distribution_type::exponential: return shape::exponential{};
    case distribution_type::log_normal: return shape::log_normal{};
    case distribution_type::logistic: return shape::logistic{};
    case distribution_type::normal: return shape::normal{};
    }
    std::unreachable();
}

std::optional<rdist::distribution_shape> rdist::shape_from_values(distribution_type       type,
                                                                  std::span<const double> values) {
    distribution_shape result = rdist::default_shape(type);

    const auto value_or = [&](std::size_t i, double fallback) { return i < values.size() ? values[i] : fallback; };

    bool valid = true;

    std::visit(
        [&](auto& s) {
            using shape_type = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<shape_type, shape::binomial>) {
                if (values.size() > 2) { valid = false; return; }

                const double n = value_or(0, s.n);
                const bool   n_is_integral =
                    std::isfinite(n) && n >= 0 && n <= std::numeric_limits<std::uint32_t>::max() && std::trunc(n) == n;
                if (!n_is_integral) { valid = false; return; }

                s.n = static_cast<std::uint32_t>(n);
                s.p = value_or(1, s.p);
            } else if constexpr (std::is_same_v<shape_type, shape::categorical>) {
                if (!rdist::has_nonzero_total_weight(values)) { valid = false; return; }

                s.weights.assign(values.begin(), values.end());
            } else if constexpr (std::is_same_v<shape_type, shape::exponential>) {
                if (values.size() > 1) { valid = false; return; }

                s.lambda = value_or(0, s.lambda);
            } else if constexpr (location_scale_shape<shape_type>) {
                if (values.size() > 2) { valid = false; return; }

                s.mu    = value_or(0, s.mu);
                s.sigma = value_or(1, s.sigma);
            } else {
                if (!values.empty()) valid = false; // uniform kinds take no parameters
            }
        },
        result);

    if (!valid) return std::nullopt;
    return result;
}

// --- Parameters ---
// ------------------

rdist::distribution_parameters::distribution_parameters() : distribution_parameters(continuous_uniform()) {}

rdist::distribution_parameters::distribution_parameters(distribution_shape shape, std::optional<double> min,
                                                        std::optional<double>       max,
                                                        std::optional<std::uint8_t> precision)
    : value(normalized(std::move(shape))), precision_digits(precision) {
    // Text formats write absent bounds as infinities, storing infinities as absent keeps equality exact
    if (min && !(std::isinf(*min) && *min < 0)) this->minimum = min;
    if (max && !(std::isinf(*max) && *max > 0)) this->maximum = max;
}

rdist::distribution_parameters rdist::distribution_parameters::continuous_uniform(double min, double max,
                                                                                  std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::continuous_uniform{}, min, max, precision};
}

rdist::distribution_parameters rdist::distribution_parameters::discrete_uniform_signed(std::optional<double> min,
                                                                                       std::optional<double> max) {
    return distribution_parameters{rdist::shape::discrete_uniform_signed{}, min, max};
}

rdist::distribution_parameters rdist::distribution_parameters::discrete_uniform_unsigned(std::optional<double> min,
                                                                                         std::optional<double> max) {
    return distribution_parameters{rdist::shape::discrete_uniform_unsigned{}, min, max};
}

rdist::distribution_parameters rdist::distribution_parameters::fixed_int32(std::int32_t value) {
    return discrete_uniform_signed(value, value);
}

rdist::distribution_parameters rdist::distribution_parameters::fixed_uint32(std::uint32_t value) {
    return discrete_uniform_unsigned(value, value);
}

rdist::distribution_parameters rdist::distribution_parameters::fixed_real(double                      value,
                                                                          std::optional<std::uint8_t> precision) {
    return continuous_uniform(value, value, precision);
}

rdist::distribution_parameters rdist::distribution_parameters::binomial(std::uint32_t n, double p) {
    return distribution_parameters{rdist::shape::binomial{.n = n, .p = p}};
}

rdist::distribution_parameters rdist::distribution_parameters::categorical(std::vector<double> weights) {
    return distribution_parameters{rdist::shape::categorical{.weights = std::move(weights)}};
}

rdist::distribution_parameters rdist::distribution_parameters::exponential(double lambda, std::optional<double> max,
                                                                           std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::exponential{.lambda = lambda}, std::nullopt, max, precision};
}

rdist::distribution_parameters rdist::distribution_parameters::positive_normal(double mu, double sigma,
                                                                               std::optional<double>       max,
                                                                               std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::positive_normal{.mu = mu, .sigma = sigma}, std::nullopt, max,
                                   precision};
}

rdist::distribution_parameters rdist::distribution_parameters::logistic(double mu, double sigma,
                                                                        std::optional<double>       min,
                                                                        std::optional<double>       max,
                                                                        std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::logistic{.mu = mu, .sigma = sigma}, min, max, precision};
}

rdist::distribution_parameters rdist::distribution_parameters::log_normal(double mu, double sigma,
                                                                          std::optional<double>       min,
                                                                          std::optional<double>       max,
                                                                          std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::log_normal{.mu = mu, .sigma = sigma}, min, max, precision};
}

rdist::distribution_parameters rdist::distribution_parameters::normal(double mu, double sigma,
                                                                      std::optional<double>       min,
                                                                      std::optional<double>       max,
                                                                      std::optional<std::uint8_t> precision) {
    return distribution_parameters{rdist::shape::normal{.mu = mu, .sigma = sigma}, min, max, precision};
}

rdist::distribution_parameters rdist::distribution_parameters::zero() { return fixed_int32(0); }

rdist::distribution_type rdist::distribution_parameters::type() const noexcept {
    return static_cast<distribution_type>(this->value.index());
}

std::vector<double> rdist::distribution_parameters::shape_values() const {
    return std::visit(
        [](const auto& s) -> std::vector<double> {
            using shape_type = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<shape_type, rdist::shape::binomial>) return {static_cast<double>(s.n), s.p};
            else if constexpr (std::is_same_v<shape_type, rdist::shape::categorical>) return s.weights;
            else if constexpr (std::is_same_v<shape_type, rdist::shape::exponential>) return {s.lambda};
            else if constexpr (location_scale_shape<shape_type>) return {s.mu, s.sigma};
            else return {};
        },
        this->value);
}

[[nodiscard]] bool same_optional(std::optional<double> a, std::optional<double> b) {
    if (a.has_value() != b.has_value()) return false;
    return !a || rdist::is_same_value(*a, *b);
}

bool rdist::operator==(const distribution_parameters& lhs, const distribution_parameters& rhs) {
    if (lhs.type() != rhs.type()) return false;
    if (lhs.precision() != rhs.precision()) return false;
    if (!same_optional(lhs.min(), rhs.min()) || !same_optional(lhs.max(), rhs.max())) return false;

    const auto lhs_values = lhs.shape_values();
    const auto rhs_values = rhs.shape_values();

    return std::ranges::equal(lhs_values, rhs_values, rdist::is_same_value);
}

// --- Combination ---
// -------------------

[[nodiscard]] std::optional<double> merge_bound(std::optional<double> a, std::optional<double> b, auto select) {
    if (a && b) return select(*a, *b);
    return a ? a : b;
}

rdist::distribution_parameters rdist::combine(const distribution_parameters& lhs, const distribution_parameters& rhs) {
    const auto min = merge_bound(lhs.min(), rhs.min(), [](double a, double b) { return std::min(a, b); });
    const auto max = merge_bound(lhs.max(), rhs.max(), [](double a, double b) { return std::max(a, b); });

    std::optional<std::uint8_t> precision = lhs.precision() ? lhs.precision() : rhs.precision();
    if (lhs.precision() && rhs.precision()) precision = std::max(*lhs.precision(), *rhs.precision());

    // Different kinds, the later kind keeps its own shape
    if (lhs.type() != rhs.type()) {
        const auto& winner = (lhs.type() > rhs.type()) ? lhs : rhs;
        return distribution_parameters{winner.shape(), min, max, precision};
    }

    // Same kind, average field-wise
    distribution_shape merged = std::visit(
        [&](const auto& a) -> distribution_shape {
            using shape_type = std::decay_t<decltype(a)>;

            const auto& b = std::get<shape_type>(rhs.shape());

            if constexpr (std::is_same_v<shape_type, shape::binomial>) {
                const auto n = static_cast<std::uint32_t>((std::uint64_t{a.n} + b.n) / 2);
                return shape::binomial{.n = n, .p = average(a.p, b.p)};
            } else if constexpr (std::is_same_v<shape_type, shape::categorical>) {
                // Elements missing from the shorter list are taken from the longer one
                const auto& longer  = a.weights.size() >= b.weights.size() ? a.weights : b.weights;
                const auto& shorter = a.weights.size() >= b.weights.size() ? b.weights : a.weights;

                std::vector<double> weights = longer;
                for (std::size_t i = 0; i < shorter.size(); ++i) weights[i] = average(longer[i], shorter[i]);

                return shape::categorical{.weights = std::move(weights)};
            } else if constexpr (std::is_same_v<shape_type, shape::exponential>) {
                return shape::exponential{.lambda = average(a.lambda, b.lambda)};
            } else if constexpr (location_scale_shape<shape_type>) {
                return shape_type{.mu = average(a.mu, b.mu), .sigma = average(a.sigma, b.sigma)};
            } else {
                return a;
            }
        },
        lhs.shape());

    return distribution_parameters{std::move(merged), min, max, precision};
}
