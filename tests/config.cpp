#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "parameters.hpp"
#include "utility/exception.hpp"
#include "utility/json.hpp"
#include "utility/version.hpp"


TEST_CASE("Config / Defaults") {
    const rdist::config config;

    CHECK(config.version == rdist::version::format_semantic());
    CHECK(config.range.floating == "min_bound");
    CHECK(config.range.integral == "min_bound");
    CHECK(config.sampling.count == 10);
    CHECK_FALSE(config.sampling.seed.has_value());

    CHECK_FALSE(config.validate().has_value());

    const rdist::range_options options = config.options();
    CHECK(options.floating == rdist::floating_range_policy::min_bound);
    CHECK(options.integral == rdist::integral_range_policy::min_bound);
}

TEST_CASE("Config / Parsing") {
    const std::string yaml = "range:\n"
                             "  floating: swap\n"
                             "  integral: zero\n"
                             "sampling:\n"
                             "  count: 25\n"
                             "  seed: 5489\n";

    const auto config = rdist::config::from_string(yaml);

    CHECK(config.version == rdist::version::format_semantic()); // missing keys keep defaults
    CHECK(config.range.floating == "swap");
    CHECK(config.range.integral == "zero");
    CHECK(config.sampling.count == 25);
    CHECK(config.sampling.seed == std::uint32_t{5489});

    REQUIRE_FALSE(config.validate().has_value());
    CHECK(config.options().floating == rdist::floating_range_policy::swap);
    CHECK(config.options().integral == rdist::integral_range_policy::zero);
}

TEST_CASE("Config / Serialization") {
    rdist::config config;
    config.range.floating = "max_bound";
    config.range.integral = "exception";
    config.sampling.count = 3;
    config.sampling.seed  = 4000000000u;

    const auto reparsed = rdist::config::from_string(config.to_string());

    CHECK(reparsed.version == config.version);
    CHECK(reparsed.range.floating == "max_bound");
    CHECK(reparsed.range.integral == "exception");
    CHECK(reparsed.sampling.count == 3);
    CHECK(reparsed.sampling.seed == std::uint32_t{4000000000u});

    const auto path = (std::filesystem::temp_directory_path() / "rdist_config_test.yaml").string();

    config.to_file(path);
    const auto from_file = rdist::config::from_file(path);
    std::filesystem::remove(path);

    CHECK(from_file.sampling.seed == config.sampling.seed);
    CHECK(from_file.range.integral == config.range.integral);

    CHECK_THROWS_AS(rdist::config::from_file("definitely/missing/rdist.yaml"), rdist::exception);
}

TEST_CASE("Config / Validation") {
    const auto error_of = [](const std::string& yaml) { return rdist::config::from_string(yaml).validate(); };

    const auto bad_version = error_of("version: \"1.2\"\n");
    REQUIRE(bad_version.has_value());
    CHECK(bad_version->find("'version'") != std::string::npos);

    const auto bad_floating = error_of("range:\n  floating: \"clamp\"\n");
    REQUIRE(bad_floating.has_value());
    CHECK(bad_floating->find("'range.floating'") != std::string::npos);

    // Integers have no NaN to fall back to
    const auto bad_integral = error_of("range:\n  integral: \"nan\"\n");
    REQUIRE(bad_integral.has_value());
    CHECK(bad_integral->find("'range.integral'") != std::string::npos);

    const auto bad_count = error_of("sampling:\n  count: 0\n");
    REQUIRE(bad_count.has_value());
    CHECK(bad_count->find("'sampling.count'") != std::string::npos);

    CHECK_THROWS_AS(rdist::config::from_string("sampling:\n  seed: -1\n"), rdist::exception);
    CHECK_THROWS_AS(rdist::config::from_string("sampling:\n  seed: 4294967296\n"), rdist::exception);
    CHECK_THROWS_AS(rdist::config::from_string("sampling:\n  count: many\n"), rdist::exception);
}

struct sampling_record {
    rdist::distribution_parameters parameters;
    std::uint32_t                  seed = 0;
    std::vector<double>            samples;
};

TEST_CASE("JSON / Parameters as round-trip strings") {
    const sampling_record record{
        .parameters = rdist::distribution_parameters::normal(0, 1, -1, 1, 3),
        .seed       = 5489,
        .samples    = {0.5, -0.25},
    };

    const std::string json = rdist::write_json(record);
    CHECK(json.find(R"("parameters":"9:-1;1:0;1:3")") != std::string::npos);

    const auto parsed = rdist::read_json<sampling_record>(json);
    CHECK(parsed.parameters == record.parameters);
    CHECK(parsed.seed == 5489);
    CHECK(parsed.samples == record.samples);

    const std::string pretty = rdist::write_jsonc(record);
    CHECK(rdist::read_json<sampling_record>(pretty).parameters == record.parameters);

    CHECK_FALSE(rdist::try_read_json<sampling_record>(R"({"parameters":"9:oops","seed":1,"samples":[]})").has_value());
    CHECK_THROWS_AS(rdist::read_json<sampling_record>(R"({"parameters":42})"), rdist::exception);
}
