// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Program entry point. Handles CLI args and invokes the analyzer.
// _________________________________________________________________________________

#include <cstdlib>
#include <filesystem>

#include "UTL/time.hpp"
#include "argparse/argparse.hpp"
#include "fmt/color.h"
#include "fmt/format.h"

#include "backend/config.hpp"
#include "backend/invoke.hpp"
#include "frontend/json.hpp"
#include "frontend/terminal.hpp"
#include "frontend/text.hpp"
#include "utility/exception.hpp"
#include "utility/version.hpp"


constexpr auto style_step    = fmt::fg(fmt::color::dark_blue) | fmt::emphasis::bold;
constexpr auto style_hint    = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
constexpr auto style_error   = fmt::fg(fmt::color::indian_red) | fmt::emphasis::bold;
constexpr auto style_path    = fmt::fg(fmt::color::saddle_brown);
constexpr auto style_enum    = fmt::fg(fmt::color::teal);
constexpr auto style_command = fmt::fg(fmt::color::purple) | fmt::emphasis::bold;

utl::time::Stopwatch stopwatch;

template <class... Args>
[[noreturn]] void exit_failure(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::print("Execution failed with code {}, elapsed time: {}\n", EXIT_FAILURE, stopwatch.elapsed_string());
    fmt::print(fmt, std::forward<Args>(args)...);
    fmt::print("\n");

    std::exit(EXIT_FAILURE);
}

template <class... Args>
[[noreturn]] void exit_failure_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::print(fmt, std::forward<Args>(args)...);
    fmt::print("\n");

    std::exit(EXIT_FAILURE);
}

template <class... Args>
[[noreturn]] void exit_success(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::print("Execution finished, elapsed time: {}\n", stopwatch.elapsed_string());
    fmt::print(fmt, std::forward<Args>(args)...);
    fmt::print("\n");

    std::exit(EXIT_SUCCESS);
}

template <class... Args>
[[noreturn]] void exit_success_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::print(fmt, std::forward<Args>(args)...);
    fmt::print("\n");

    std::exit(EXIT_SUCCESS);
}

int main(int argc, char* argv[]) try {
    // Handle CLI args
    const std::string version = cpa::version::format_full();

    argparse::ArgumentParser cli(cpa::version::program, version, argparse::default_arguments::none);

    cli.add_description("Bottom-up & flame graph report generator for `.cpuprofile` CPU profiles");

    cli                                //
        .add_argument("-h", "--help")  //
        .flag()                        //
        .help("Displays help message") //
        .action([&](const auto&) {     //
            exit_success_quiet("{}", cli.help().str());
        });

    cli                                       //
        .add_argument("-v", "--version")      //
        .flag()                               //
        .help("Displays application version") //
        .action([&](const auto&) {            //
            exit_success_quiet("{}", version);
        });

    cli                                                                         //
        .add_argument("-w", "--write-config")                                   //
        .flag()                                                                 //
        .help("Creates config file corresponding to the default configuration") //
        .action([](const auto&) {                                               //
            const std::string path = cpa::config::default_path;
            cpa::config{}.to_file(path);
            exit_success("Serialized a copy of default config to {{ {} }}", path);
        });

    cli                                                  //
        .add_argument("profile")                         //
        .help("Path of the '.cpuprofile' to analyze");   //

    cli                                                         //
        .add_argument("-c", "--config")                         //
        .default_value(std::string{cpa::config::default_path}) //
        .required()                                             //
        .help("Specifies custom config path");                  //

    cli                                             //
        .add_argument("-a", "--artifacts")          //
        .default_value(std::string{".cpa/"})        //
        .required()                                 //
        .help("Specifies custom output directory"); //

    cli                                               //
        .add_argument("-o", "--output")               //
        .required()                                   //
        .choices("terminal", "text", "json")          //
        .default_value(std::string{"terminal"})       //
        .help("Selects profiling output format");     //

    cli                                                        //
        .add_argument("-l", "--layout")                        //
        .choices("timeline", "left_heavy")                     //
        .help("Selects flame graph layout, overrides config"); //

    try {
        cli.parse_args(argc, argv);
    } catch (std::exception& e) {
        fmt::print("{}\n", fmt::styled("Error parsing CLI arguments:", style_error));
        fmt::print("\n");
        fmt::print("{}\n", e.what());
        fmt::print("\n");
        fmt::print("Run {} to see the full usage guide.\n",
                   fmt::styled(std::string{cpa::version::program} + " --help", style_command));
        exit_failure_quiet("");
    }

    // Parse config
    const std::string working_directory = std::filesystem::current_path().string();
    const std::string config_path       = cli.get<std::string>("--config");

    fmt::print(style_step, "Step 1/5: ");
    fmt::print("Working directory is {{ {} }}...\n", fmt::styled(working_directory, style_path));

    fmt::print(style_step, "Step 2/5: ");
    fmt::print("Parsing config {{ {} }}...\n", fmt::styled(config_path, style_path));

    cpa::config config = std::filesystem::exists(config_path) ? cpa::config::from_file(config_path) : cpa::config{};

    if (auto layout = cli.present<std::string>("--layout")) config.flame.layout = std::move(*layout);

    if (const auto err = config.validate()) exit_failure("Config validation error:\n{}", err.value());

    // Analyze the profile
    const std::string profile_path = cli.get<std::string>("profile");

    fmt::print(style_step, "Step 3/5: ");
    fmt::print("Reading profile {{ {} }}...\n", fmt::styled(profile_path, style_path));

    const cpa::raw_profile raw = cpa::read_profile_file(profile_path);

    fmt::print(style_step, "Step 4/5: ");
    fmt::print("Analyzing {} nodes & {} samples...\n", raw.nodes.size(), raw.samples ? raw.samples->size() : 0);

    if (!raw.samples || !raw.time_deltas) {
        fmt::print(style_hint, "Hint: ");
        fmt::print("Profile has no samples, the capture was likely aborted, results will be empty\n");
    }

    cpa::profile profile = cpa::analyze_profile(raw, config);
    profile.name         = profile_path;

    // Invoke the frontend
    const std::string selected_output = cli.get("--output");

    fmt::print(style_step, "Step 5/5: ");
    fmt::print("Invoking frontend for {{ {} }}...\n", fmt::styled(selected_output, style_enum));

    const std::filesystem::path output_directory_path = cli.get<std::string>("--artifacts");

    if (selected_output == "terminal") {
        cpa::output::terminal(profile);
    } else if (selected_output == "json") {
        cpa::output::json(profile, output_directory_path);

        const auto report_path = output_directory_path / "profiling.json";

        fmt::print(style_hint, "Hint: ");
        fmt::print("Profile dump was written to ");
        fmt::print(style_path, "{}", report_path.string());
        fmt::print("\n");

    } else if (selected_output == "text") {
        cpa::output::text(profile, output_directory_path);

        const auto report_path = output_directory_path / "report.txt";

        fmt::print(style_hint, "Hint: ");
        fmt::print("To open the generated report in text editor run ");
        fmt::print(style_command, "open {}", report_path.string());
        fmt::print("\n");

    } else {
        exit_failure("Unknown output format {{ {} }}.", selected_output);
    }

    exit_success("");

} catch (cpa::exception& e) {
    fmt::print("Terminated due to exception:\n{}\n", e.what());
    return EXIT_FAILURE;
    // we use a custom exception class with more debug info & colored formatting
} catch (std::exception& e) {
    fmt::print("Terminated due to unhandled exception:\n{}\n", e.what());
    return EXIT_FAILURE;
    // there should be no other exceptions unless we run into an 'std::bad_alloc'
}
