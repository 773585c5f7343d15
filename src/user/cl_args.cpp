#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <dockgrader/common/expected.hpp>
#include <dockgrader/logging.hpp>
#include <dockgrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dockgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ DOCKGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout); term_sz && term_sz->ws_col > 0) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(
        fmt::format("DockGrader v{}\nBuilds and tests a submission inside a disposable container.",
                    DOCKGRADER_VERSION_STRING));
    arg_parser_.add_epilog("Exit status: 0 if the submission passed, 1 if it was graded and failed, "
                           "2 if it could not be graded.");

    // clang-format off
    arg_parser_.add_argument("submission")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.submission_path = opt; })
        .help("Directory containing the submitted files, including its Makefile");

    arg_parser_.add_argument("tests")
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.tests_path = opt; })
        .help("JSON file with the test vectors: an array of [stdin, expected] pairs\n"
              "or of {\"input\": ..., \"output\": ...} objects");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", DOCKGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("--build-timeout")
        .metavar("SECONDS")
        .default_value(opts_buffer_.build_timeout_secs)
        .store_into(opts_buffer_.build_timeout_secs)
        .help("Wall-clock budget of the build phase");

    arg_parser_.add_argument("--test-timeout")
        .metavar("SECONDS")
        .default_value(opts_buffer_.test_timeout_secs)
        .store_into(opts_buffer_.test_timeout_secs)
        .help("Wall-clock budget per test vector. The test phase as a whole gets this\n"
              "times the number of vectors.");

    arg_parser_.add_argument("--image")
        .metavar("NAME")
        .default_value(opts_buffer_.image)
        .store_into(opts_buffer_.image)
        .help("Container image to build and run the submission in");

    arg_parser_.add_argument("--memory-limit")
        .metavar("SIZE")
        .default_value(opts_buffer_.memory_limit)
        .store_into(opts_buffer_.memory_limit)
        .help("Memory ceiling of the container, in docker's notation (e.g. 64m)");

    arg_parser_.add_argument("--docker")
        .metavar("PATH")
        .default_value(opts_buffer_.docker_exec)
        .store_into(opts_buffer_.docker_exec)
        .help("Docker client executable, looked up in PATH if not a path");

    arg_parser_.add_argument("--staging-dir")
        .metavar("DIR")
        .default_value(opts_buffer_.staging_root.string())
        .action([this] (const std::string& opt) { opts_buffer_.staging_root = opt; })
        .help("Host directory for per-session scratch directories (mounted into the container)");

    arg_parser_.add_argument("--format")
        .choices("text", "json")
        .default_value(std::string{"text"})
        .metavar("FMT")
        .nargs(1)
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::OutputFormat;

                opts_buffer_.output_format = opt == "json" ? Json : Text;
        })
        .help("Output format of the result");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace dockgrader
