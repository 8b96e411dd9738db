// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Program entry point. Handles CLI args, parses the distribution and prints
// its properties & samples.
// _________________________________________________________________________________

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <UTL/time.hpp>
#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "codec.hpp"
#include "config.hpp"
#include "distribution/dispatch.hpp"
#include "generator/random_generator.hpp"
#include "generator/seed.hpp"
#include "utility/exception.hpp"
#include "utility/json.hpp"
#include "utility/version.hpp"


constexpr auto style_step    = fmt::fg(fmt::color::dark_blue) | fmt::emphasis::bold;
constexpr auto style_error   = fmt::fg(fmt::color::indian_red) | fmt::emphasis::bold;
constexpr auto style_path    = fmt::fg(fmt::color::saddle_brown);
constexpr auto style_enum    = fmt::fg(fmt::color::teal);
constexpr auto style_value   = fmt::fg(fmt::color::light_green);
constexpr auto style_command = fmt::fg(fmt::color::purple) | fmt::emphasis::bold;

utl::time::Stopwatch stopwatch;

enum class exit_report { none, timed };

// Prints the closing message and terminates, 'timed' exits also report the status & run time
template <class... Args>
[[noreturn]] void terminate_with(int code, exit_report mode, fmt::format_string<Args...> fmt, Args&&... args) {
    if (mode == exit_report::timed) {
        if (code == EXIT_SUCCESS) fmt::println("Done in {}", stopwatch.elapsed_string());
        else fmt::println("Stopped with exit code {} after {}", code, stopwatch.elapsed_string());
    }

    fmt::println(fmt, std::forward<Args>(args)...);
    std::exit(code);
}

template <class... Args>
[[noreturn]] void fail(fmt::format_string<Args...> fmt, Args&&... args) {
    terminate_with(EXIT_FAILURE, exit_report::timed, fmt, std::forward<Args>(args)...);
}

// Layout of the '--output json' document
struct report {
    rdist::distribution_parameters                parameters;
    std::uint32_t                                 seed = 0;
    std::optional<rdist::distribution_properties> properties;
    std::vector<double>                           samples;
};

void print_properties(const rdist::distribution_properties& properties) {
    fmt::println("   minimum  = {}", properties.minimum);
    fmt::println("   maximum  = {}", properties.maximum);
    fmt::println("   mean     = {}", properties.mean);
    fmt::println("   median   = {}", properties.median);
    fmt::println("   mode     = {}", properties.mode);
    fmt::println("   variance = {}", properties.variance);
}

int main(int argc, char* argv[]) try {
    // Handle CLI args
    const std::string version = rdist::version::format_full();

    argparse::ArgumentParser cli(rdist::version::program, version, argparse::default_arguments::none);

    cli.add_description("Seedable sampling from probability distributions described by a parameter string");

    cli.add_epilog("Distributions can be given in the general form, e.g. \"Normal distribution (-1;1) [0;1] r:3\", "
                   "or in the round-trip form, e.g. \"9:-1;1:0;1:3\"");

    cli                                //
        .add_argument("-h", "--help")  //
        .flag()                        //
        .help("Shows usage and exits") //
        .action([&](const auto&) {     //
            terminate_with(EXIT_SUCCESS, exit_report::none, "{}", cli.help().str());
        });

    cli                                         //
        .add_argument("-v", "--version")        //
        .flag()                                 //
        .help("Shows version & build platform") //
        .action([&](const auto&) {              //
            terminate_with(EXIT_SUCCESS, exit_report::none, "{}", version);
        });

    cli                                                                  //
        .add_argument("-w", "--write-config")                            //
        .flag()                                                          //
        .help("Writes the default config next to the working directory") //
        .action([](const auto&) {                                        //
            const std::string path = rdist::config::default_path;
            rdist::config{}.to_file(path);
            terminate_with(EXIT_SUCCESS, exit_report::timed, "Default config written to {{ {} }}", path);
        });

    cli                                             //
        .add_argument("-c", "--config")             //
        .default_value(rdist::config::default_path) //
        .required()                                 //
        .help("Specifies custom config path");      //

    cli                                                              //
        .add_argument("-d", "--distribution")                        //
        .required()                                                  //
        .help("Selects distribution in general or round-trip form"); //

    cli                                                           //
        .add_argument("-n", "--count")                            //
        .scan<'i', std::int64_t>()                                //
        .help("Selects number of samples, overrides the config"); //

    cli                                                        //
        .add_argument("-s", "--seed")                          //
        .scan<'u', std::uint32_t>()                            //
        .help("Selects generator seed, overrides the config"); //

    cli                                     //
        .add_argument("-o", "--output")     //
        .required()                         //
        .choices("text", "json")            //
        .default_value(std::string{"text"}) //
        .help("Selects output format");     //

    cli                                          //
        .add_argument("-p", "--properties")      //
        .flag()                                  //
        .help("Prints distribution properties"); //

    cli                                                      //
        .add_argument("-r", "--round-trip")                  //
        .flag()                                              //
        .help("Prints round-trip form of the distribution"); //

    try {
        cli.parse_args(argc, argv);
    } catch (std::exception& e) {
        fmt::println("{}", fmt::styled("Error parsing CLI arguments:", style_error));
        fmt::println("");
        fmt::println("{}", e.what());
        fmt::println("");
        fmt::println("Run {} to see the full usage guide.", fmt::styled("rdist --help", style_command));
        terminate_with(EXIT_FAILURE, exit_report::none, "");
    }

    const std::string selected_output = cli.get("--output");
    const bool        quiet           = (selected_output == "json"); // keeps stdout a valid JSON document

    // Parse config
    const std::string config_path = cli.get<std::string>("--config");

    if (!quiet) {
        fmt::print(style_step, "Step 1/4: ");
        fmt::println("Parsing config {{ {} }}...", fmt::styled(config_path, style_path));
    }

    const rdist::config config =
        std::filesystem::exists(config_path) ? rdist::config::from_file(config_path) : rdist::config{};

    if (const auto err = config.validate()) fail("Invalid config {{ {} }}:\n{}", config_path, err.value());

    // Parse distribution
    const std::string text = cli.get<std::string>("--distribution");

    if (!quiet) {
        fmt::print(style_step, "Step 2/4: ");
        fmt::println("Parsing distribution {{ {} }}...", fmt::styled(text, style_value));
    }

    rdist::distribution_parameters parameters;
    if (!rdist::codec::try_parse(text, parameters)) fail("Could not parse distribution {{ {} }}", text);

    // Seed the generator
    const std::uint32_t default_seed = config.sampling.seed ? *config.sampling.seed : rdist::new_seed();

    const std::uint32_t seed  = cli.present<std::uint32_t>("--seed").value_or(default_seed);
    const std::int64_t  count = cli.present<std::int64_t>("--count").value_or(config.sampling.count);

    if (count < 0) fail("Number of samples should be non-negative, got {{ {} }}", count);

    if (!quiet) {
        fmt::print(style_step, "Step 3/4: ");
        fmt::println("Sampling {} values with seed {}...", count, fmt::styled(seed, style_value));
    }

    rdist::random_generator generator(seed, config.options());

    report output{
        .parameters = parameters,
        .seed       = seed,
        .properties = cli.get<bool>("--properties") ? std::optional{rdist::properties(parameters)} : std::nullopt,
        .samples    = rdist::sample(generator, parameters, count).collect(),
    };

    // Print results
    if (quiet) terminate_with(EXIT_SUCCESS, exit_report::none, "{}", rdist::write_jsonc(output));

    fmt::print(style_step, "Step 4/4: ");
    fmt::println("Printing results as {{ {} }}...", fmt::styled(selected_output, style_enum));
    fmt::println("");

    fmt::println("Distribution: {}", rdist::codec::format_general(parameters));
    if (cli.get<bool>("--round-trip")) fmt::println("Round-trip:   {}", rdist::codec::format_round_trip(parameters));

    if (output.properties) {
        fmt::println("Properties:");
        print_properties(*output.properties);
    }

    fmt::println("Samples:");
    for (const double value : output.samples) fmt::println("   {}", value);
    fmt::println("");

    terminate_with(EXIT_SUCCESS, exit_report::timed, "");

} catch (rdist::exception& e) {
    fmt::println("Terminated due to exception:\n{}", e.what());
    return EXIT_FAILURE;
} catch (std::exception& e) {
    fmt::println("Terminated due to unexpected exception:\n{}", e.what());
    return EXIT_FAILURE; // standard library failures such as 'std::bad_alloc'
}
