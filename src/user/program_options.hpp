#pragma once

#include "output/verbosity.hpp"

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/common/expected.hpp>
#include <dockgrader/common/formatters/debug.hpp>
#include <dockgrader/grader_config.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>

namespace dockgrader {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for plain text output
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// Directory whose (non-hidden) files make up the submission
    std::filesystem::path submission_path;

    /// JSON file with the test vectors
    std::filesystem::path tests_path;

    double build_timeout_secs = GraderConfig::DEFAULT_BUILD_TIMEOUT.count();
    /// Per vector; the test phase as a whole gets this times the number of vectors
    double test_timeout_secs = GraderConfig::DEFAULT_TEST_TIMEOUT.count();

    std::string image = std::string{GraderConfig::DEFAULT_IMAGE};
    std::string memory_limit = std::string{GraderConfig::DEFAULT_MEMORY_LIMIT};
    std::string docker_exec = std::string{DEFAULT_DOCKER_EXEC};
    std::filesystem::path staging_root = GraderConfig::DEFAULT_STAGING_ROOT;

    enum class OutputFormat { Text, Json } output_format = OutputFormat::Text;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_DOCKER_EXEC = "docker";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Assume that all enumerators have valid values except for verbosity
        // which we will just clamp to [MIN, MAX]
        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (build_timeout_secs <= 0.0) {
            return fmt::format("Build timeout must be positive (got {})", build_timeout_secs);
        }
        if (test_timeout_secs <= 0.0) {
            return fmt::format("Test timeout must be positive (got {})", test_timeout_secs);
        }
        if (image.empty()) {
            return std::string{"Image name must not be empty"};
        }

        TRY(ensure_is_directory(submission_path, "Submission directory {:?}"));
        TRY(ensure_is_regular_file(tests_path, "Tests file {:?}"));

        return {};
    }

    /// Configuration of the grading core described by these options
    GraderConfig to_grader_config() const {
        GraderConfig config;

        config.build_timeout = Seconds{build_timeout_secs};
        config.test_timeout = Seconds{test_timeout_secs};
        config.image = image;
        config.memory_limit = memory_limit;
        config.staging_root = staging_root;

        return config;
    }
};

} // namespace dockgrader

template <>
struct fmt::formatter<::dockgrader::ProgramOptions> : ::dockgrader::DebugFormatter
{
    auto format(const ::dockgrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, submission={}, tests={}, build_timeout={}s, test_timeout={}s, "
                              "image={}, memory_limit={}, docker={}, staging_root={}, format={}, color_opt={}}}",
                              fmt::underlying(from.verbosity), from.submission_path, from.tests_path,
                              from.build_timeout_secs, from.test_timeout_secs, from.image, from.memory_limit,
                              from.docker_exec, from.staging_root, fmt::underlying(from.output_format),
                              fmt::underlying(from.colorize_option));
    }
};
