#pragma once

#include <dockgrader/common/formatters/macros.hpp>
#include <dockgrader/grading_result.hpp>

#include <fmt/chrono.h>
#include <fmt/std.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace dockgrader {

/// Everything a GradingSession needs to know that does not come from the submission itself
struct GraderConfig
{
    /// Wall-clock budget for the whole build phase
    Seconds build_timeout = DEFAULT_BUILD_TIMEOUT;
    /// Wall-clock budget per test vector; the test phase as a whole gets `test_timeout * number of vectors`
    Seconds test_timeout = DEFAULT_TEST_TIMEOUT;

    std::string image = std::string{DEFAULT_IMAGE};
    /// Memory ceiling requested from the engine, in the engine's own notation (e.g. "64m")
    std::string memory_limit = std::string{DEFAULT_MEMORY_LIMIT};

    /// Host directory under which per-session staging directories are created
    std::filesystem::path staging_root = DEFAULT_STAGING_ROOT;

    // Paths inside the environment
    std::string source_dir = "/root/source";
    std::string input_mount_dir = "/root/input";
    std::string input_file = "/root/input/input.txt";
    std::string output_file = "/root/source/output.txt";

    /// Name of the build recipe file expected in the submission root
    std::string recipe_file = "Makefile";
    std::string build_command = "make build";

    static constexpr Seconds DEFAULT_BUILD_TIMEOUT{10.0};
    static constexpr Seconds DEFAULT_TEST_TIMEOUT{2.0};
    static constexpr std::string_view DEFAULT_IMAGE = "dockgrader-checker";
    static constexpr std::string_view DEFAULT_MEMORY_LIMIT = "64m";
    static constexpr std::string_view DEFAULT_STAGING_ROOT = "solutions";

    /// Aggregate budget of the test phase for ``num_vectors`` vectors; never less than a single vector's
    Seconds test_phase_budget(std::size_t num_vectors) const {
        return test_timeout * static_cast<double>(std::max<std::size_t>(num_vectors, 1));
    }
};

} // namespace dockgrader

FMT_SERIALIZE_CLASS(::dockgrader::GraderConfig, build_timeout, test_timeout, image, memory_limit, staging_root,
                    source_dir, input_file, output_file);
