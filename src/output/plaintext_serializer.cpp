#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace dockgrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_session_begin(const GraderConfig& config, int num_vectors) {
    if (!should_output_timings(verbosity_)) {
        return;
    }

    std::string out = fmt::format("Grading with image {} ({} memory), {} {}\n", style_str(config.image, VALUE_STYLE),
                                  config.memory_limit, num_vectors, pluralize("test", num_vectors));
    out += fmt::format("Budgets: build {}, tests {} ({} per test)\n", config.build_timeout,
                       config.test_phase_budget(static_cast<std::size_t>(num_vectors)), config.test_timeout);

    sink_.write(out);
}

void PlainTextSerializer::on_result(const ResultRecord& result) {
    if (!should_output_verdict(verbosity_)) {
        return;
    }

    const auto verdict_style = result.passed() ? SUCCESS_STYLE : ERROR_STYLE;

    std::string out;

    if (should_output_message(verbosity_)) {
        out += line_divider(terminal_width_) + "\n";
    }

    out += fmt::format("Verdict: {} ({}/{} {} passed)\n", style_str(verdict_name(result.status), verdict_style),
                       style_str(result.tests_passed, VALUE_STYLE), result.tests_total,
                       pluralize("test", result.tests_total));

    if (should_output_message(verbosity_)) {
        if (result.passed()) {
            out += result.lint_success ? style_str("Style check passed", SUCCESS_STYLE)
                                       : style_str("Style check found problems", WARNING_STYLE);
            out += "\n";
        }

        if (!result.message.empty()) {
            out += fmt::format("\n{}\n", result.message);
        }
    }

    if (should_output_timings(verbosity_)) {
        out += fmt::format("\nBuild time: {:.4f}s\nCheck time: {:.4f}s\n", round_seconds(result.build_time),
                           round_seconds(result.check_time));
    }

    if (should_output_message(verbosity_)) {
        out += line_divider(terminal_width_) + "\n";
    }

    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string_view PlainTextSerializer::verdict_name(Verdict verdict) {
    using enum Verdict;

    switch (verdict) {
    case Ok:
        return "OK";
    case Checking:
        return "Checking";
    case BuildError:
        return "Build Error";
    case RuntimeError:
        return "Runtime Error";
    case CheckError:
        return "Wrong Answer";
    case RuntimeTimeout:
        return "Runtime Timeout";
    case BuildTimeout:
        return "Build Timeout";
    case LintError:
        return "Lint Error";
    case Draft:
        return "Draft";
    }

    return "Unknown";
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error(), DEFAULT_WIDTH);
    }

    // Some terminals (and pseudo-terminals without a size) report 0 columns
    const std::size_t cols = width.value_or(DEFAULT_WIDTH);

    return cols == 0 ? DEFAULT_WIDTH : cols;
}

} // namespace dockgrader
