// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "config.hpp"

#include <format>
#include <fstream>
#include <limits>
#include <regex>

#include <fkYAML/node.hpp>

#include "utility/exception.hpp"


// Reads the whole file in a single allocation
[[nodiscard]] std::string read_file_to_string(const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary); // opened at the end, so 'tellg()' gives the size
    if (!file.good()) throw rdist::exception("Could not open file {{ {} }}", path);

    const auto file_size = file.tellg();
    file.seekg(std::ios::beg);
    std::string chars(file_size, 0);
    file.read(chars.data(), file_size);
    return chars;
}

rdist::config rdist::config::from_string(std::string_view str) try {
    const fkyaml::node root = fkyaml::node::deserialize(str);

    rdist::config config;

    if (root.contains("version")) config.version = root.at("version").as_str();

    if (root.contains("range")) {
        const auto& range = root.at("range");

        if (range.contains("floating")) config.range.floating = range.at("floating").as_str();
        if (range.contains("integral")) config.range.integral = range.at("integral").as_str();
    }

    if (root.contains("sampling")) {
        const auto& sampling = root.at("sampling");

        if (sampling.contains("count")) config.sampling.count = sampling.at("count").as_int();

        if (sampling.contains("seed")) {
            const std::int64_t seed = sampling.at("seed").as_int();

            if (seed < 0 || seed > std::numeric_limits<std::uint32_t>::max())
                throw rdist::exception{"'sampling.seed' has a value {{ {} }} outside of the 32-bit unsigned range",
                                       seed};

            config.sampling.seed = static_cast<std::uint32_t>(seed);
        }
    }

    return config;
} catch (std::exception& e) { throw rdist::exception{"Could not parse config error:\n{}", e.what()}; }

rdist::config rdist::config::from_file(std::string_view path) {
    return rdist::config::from_string(read_file_to_string(std::string(path)));
}

std::string rdist::config::to_string() const {
    fkyaml::node root = fkyaml::node::mapping();

    root["version"]  = this->version;
    root["range"]    = fkyaml::node::mapping();
    root["sampling"] = fkyaml::node::mapping();

    root["range"]["floating"] = this->range.floating;
    root["range"]["integral"] = this->range.integral;
    root["sampling"]["count"] = this->sampling.count;

    if (this->sampling.seed) root["sampling"]["seed"] = static_cast<std::int64_t>(*this->sampling.seed);

    return fkyaml::node::serialize(root);
}

void rdist::config::to_file(std::string_view path) const { std::ofstream(std::string(path)) << this->to_string(); }

// Function for validating the config & making user-friendly error messages
std::optional<std::string> rdist::config::validate() const {

    // Validate version
    if (!std::regex_match(this->version, std::regex{R"(^\d+\.\d+\.\d+$)"})) {
        constexpr auto fmt = "'version' has a value {{ {} }}, which doesn't match the schema <major>.<minor>.<patch>";
        return std::format(fmt, this->version);
    }

    // Validate range policies
    try {
        [[maybe_unused]] const auto policy = rdist::floating_range_policy_from_name(this->range.floating);
    } catch (rdist::domain_error&) {
        constexpr auto fmt = "'range.floating' has a value {{ {} }}, expected one of "
                             "min_bound, zero, max_bound, swap, exception, nan";
        return std::format(fmt, this->range.floating);
    }

    try {
        [[maybe_unused]] const auto policy = rdist::integral_range_policy_from_name(this->range.integral);
    } catch (rdist::domain_error&) {
        constexpr auto fmt = "'range.integral' has a value {{ {} }}, expected one of "
                             "min_bound, zero, max_bound, swap, exception (integers can't be NaN)";
        return std::format(fmt, this->range.integral);
    }

    // Validate sampling
    if (this->sampling.count < 1) {
        constexpr auto fmt = "'sampling.count' has a value {{ {} }}, at least one sample is required";
        return std::format(fmt, this->sampling.count);
    }

    return std::nullopt;
}

rdist::range_options rdist::config::options() const {
    return {
        .floating = rdist::floating_range_policy_from_name(this->range.floating),
        .integral = rdist::integral_range_policy_from_name(this->range.integral),
    };
}
