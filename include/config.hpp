// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Struct representation of the YAML config and its parsing/serialization.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "generator/range_policy.hpp"
#include "utility/version.hpp"


namespace rdist {

struct config {

    // --- Subclasses ---
    // ------------------

    // Policy names are kept as strings so 'validate()' can report bad ones nicely
    struct range_section {
        std::string floating = "min_bound";
        std::string integral = "min_bound";
    };

    struct sampling_section {
        std::int64_t                 count = 10;
        std::optional<std::uint32_t> seed  = std::nullopt; // absent means an entropy seed
    };

    // --- Members ---
    // ---------------

    std::string version = version::format_semantic();

    range_section    range;
    sampling_section sampling;

    constexpr static auto default_path = ".rdist";

    // --- Parsing/serialization ---
    // -----------------------------

    static config from_string(std::string_view str);
    static config from_file(std::string_view path);

    std::string to_string() const;
    void        to_file(std::string_view path) const;

    std::optional<std::string> validate() const;

    // Expects a validated config
    range_options options() const;
};

} // namespace rdist
