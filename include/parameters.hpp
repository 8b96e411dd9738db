// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Value type describing a distribution: its kind & shape parameters together
// with optional bounds and an optional rounding precision.
//
// Shape is a 'std::variant' with one alternative per kind, so a value can never
// carry fields that don't belong to its kind. Variant index matches the kind
// index used in the round-trip text format, keep the order stable.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>


namespace rdist {

enum class distribution_type : std::uint8_t {
    continuous_uniform        = 0,
    discrete_uniform_signed   = 1,
    discrete_uniform_unsigned = 2,
    binomial                  = 3,
    categorical               = 4,
    positive_normal           = 5,
    exponential               = 6,
    log_normal                = 7,
    logistic                  = 8,
    normal                    = 9
};

constexpr std::size_t distribution_type_count = 10;

// --- Shapes ---
// --------------

namespace shape {

struct continuous_uniform {
    bool operator==(const continuous_uniform&) const = default;
};

struct discrete_uniform_signed {
    bool operator==(const discrete_uniform_signed&) const = default;
};

struct discrete_uniform_unsigned {
    bool operator==(const discrete_uniform_unsigned&) const = default;
};

struct binomial {
    std::uint32_t n = 1;
    double        p = 0.5;
};

struct categorical {
    std::vector<double> weights = {}; // empty means 3 equal categories
};

struct positive_normal {
    double mu    = 0;
    double sigma = 1;
};

struct exponential {
    double lambda = 1;
};

struct log_normal {
    double mu    = 0;
    double sigma = 1;
};

struct logistic {
    double mu    = 0;
    double sigma = 1;
};

struct normal {
    double mu    = 0;
    double sigma = 1;
};

} // namespace shape

using distribution_shape =
    std::variant<shape::continuous_uniform, shape::discrete_uniform_signed, shape::discrete_uniform_unsigned,
                 shape::binomial, shape::categorical, shape::positive_normal, shape::exponential, shape::log_normal,
                 shape::logistic, shape::normal>;

static_assert(std::variant_size_v<distribution_shape> == distribution_type_count);

// --- Kind lookup ---
// -------------------

[[nodiscard]] std::string_view distribution_type_name(distribution_type type); // 'PascalCase'

[[nodiscard]] std::optional<distribution_type> distribution_type_from_name(std::string_view name);
[[nodiscard]] std::optional<distribution_type> distribution_type_from_index(std::size_t index);

[[nodiscard]] distribution_shape default_shape(distribution_type type);

// Builds a shape from its ordered parameter list, missing trailing values take their defaults.
// Returns nothing for too many values, non-integral or out-of-range binomial 'n',
// and categorical weights with zero total.
[[nodiscard]] std::optional<distribution_shape> shape_from_values(distribution_type     type,
                                                                  std::span<const double> values);

// --- Parameters ---
// ------------------

class distribution_parameters {
public:
    distribution_parameters(); // continuous uniform over '[0, 1)'

    // Normalizes the input: non-positive finite scales become 'nearly_zero', categorical weights are
    // normalized, '-inf' minimum & '+inf' maximum are stored as absent. Throws 'rdist::domain_error'
    // for categorical weights with zero total.
    explicit distribution_parameters(distribution_shape shape, std::optional<double> min = std::nullopt,
                                     std::optional<double>       max       = std::nullopt,
                                     std::optional<std::uint8_t> precision = std::nullopt);

    // --- Named constructors ---

    // clang-format off
    [[nodiscard]] static distribution_parameters continuous_uniform(double min = 0, double max = 1,
                                                                    std::optional<std::uint8_t> precision = std::nullopt);
    [[nodiscard]] static distribution_parameters discrete_uniform_signed(std::optional<double> min = std::nullopt,
                                                                         std::optional<double> max = std::nullopt);
    [[nodiscard]] static distribution_parameters discrete_uniform_unsigned(std::optional<double> min = std::nullopt,
                                                                           std::optional<double> max = std::nullopt);

    [[nodiscard]] static distribution_parameters fixed_int32(std::int32_t value);
    [[nodiscard]] static distribution_parameters fixed_uint32(std::uint32_t value);
    [[nodiscard]] static distribution_parameters fixed_real(double value, std::optional<std::uint8_t> precision = std::nullopt);

    [[nodiscard]] static distribution_parameters binomial(std::uint32_t n = 1, double p = 0.5);
    [[nodiscard]] static distribution_parameters categorical(std::vector<double> weights = {});

    [[nodiscard]] static distribution_parameters exponential(double lambda = 1, std::optional<double> max = std::nullopt,
                                                             std::optional<std::uint8_t> precision = std::nullopt);
    [[nodiscard]] static distribution_parameters positive_normal(double mu = 0, double sigma = 1,
                                                                 std::optional<double> max = std::nullopt,
                                                                 std::optional<std::uint8_t> precision = std::nullopt);

    [[nodiscard]] static distribution_parameters logistic(double mu = 0, double sigma = 1,
                                                          std::optional<double> min = std::nullopt,
                                                          std::optional<double> max = std::nullopt,
                                                          std::optional<std::uint8_t> precision = std::nullopt);
    [[nodiscard]] static distribution_parameters log_normal(double mu = 0, double sigma = 1,
                                                            std::optional<double> min = std::nullopt,
                                                            std::optional<double> max = std::nullopt,
                                                            std::optional<std::uint8_t> precision = std::nullopt);
    [[nodiscard]] static distribution_parameters normal(double mu = 0, double sigma = 1,
                                                        std::optional<double> min = std::nullopt,
                                                        std::optional<double> max = std::nullopt,
                                                        std::optional<std::uint8_t> precision = std::nullopt);
    // clang-format on

    [[nodiscard]] static distribution_parameters zero(); // always the signed integer 0

    // --- Accessors ---

    [[nodiscard]] distribution_type         type() const noexcept;
    [[nodiscard]] const distribution_shape& shape() const noexcept { return this->value; }

    [[nodiscard]] std::optional<double>       min() const noexcept { return this->minimum; }
    [[nodiscard]] std::optional<double>       max() const noexcept { return this->maximum; }
    [[nodiscard]] std::optional<std::uint8_t> precision() const noexcept { return this->precision_digits; }

    // Ordered parameter list of the shape, as written by the text formats
    [[nodiscard]] std::vector<double> shape_values() const;

private:
    distribution_shape          value;
    std::optional<double>       minimum;
    std::optional<double>       maximum;
    std::optional<std::uint8_t> precision_digits;
};

// Bitwise comparison of every field, NaN equals NaN
[[nodiscard]] bool operator==(const distribution_parameters& lhs, const distribution_parameters& rhs);

// Merges two parameter sets: the kind with the larger index wins, shapes of the same kind are averaged
// field by field, bounds widen to cover both and the larger precision is kept
[[nodiscard]] distribution_parameters combine(const distribution_parameters& lhs, const distribution_parameters& rhs);

} // namespace rdist
