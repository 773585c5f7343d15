#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace dockgrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_session_begin(const GraderConfig& config, int num_vectors) override;
    void on_result(const ResultRecord& result) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// Human-readable name of a verdict, e.g. "Runtime Timeout"
    static std::string_view verdict_name(Verdict verdict);

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Plural if and only if `count != 1`
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - failing verdicts, fatal errors, etc.
    //   success  - the OK verdict
    //   value    - counts, timings and other literal values
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green) | fmt::emphasis::bold;
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static std::string line_divider(std::size_t len) { return std::string(len, '-'); }

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace dockgrader
