/// \file
/// Mapping of phase outcomes onto the verdict taxonomy
#pragma once

#include <dockgrader/common/formatters/macros.hpp>
#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/phase_supervisor.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dockgrader {

/// What the submission's build recipe declares
struct RecipeTargets
{
    bool has_run = false;
    bool has_build = false;
};

/// Targets declared by ``recipe`` (a Makefile). Detection is textual: "run:" / "build:" anywhere in the file.
RecipeTargets inspect_recipe(std::string_view recipe);

struct RecipeValidation
{
    RecipeTargets targets;
    /// The BuildError record to report without provisioning anything, if the recipe is unusable
    std::optional<ResultRecord> rejection;
};

/// Validates the recipe named ``recipe_name`` among the submitted ``files``.
/// `targets.has_build` decides whether a build phase is needed.
RecipeValidation validate_recipe(const FileMap& files, std::string_view recipe_name, int tests_total);

/// A BuildTimeout or BuildError record, or std::nullopt if testing may proceed
std::optional<ResultRecord> classify_build(const PhaseOutcome<ExecResult>& build, int tests_total);

/// Adopts the runner's verdict and counts, or reports a RuntimeTimeout with nothing passed
ResultRecord classify_test(PhaseOutcome<ResultRecord> test, int tests_total);

/// Records the analysis result on an Ok record; findings are appended to the message, the status is kept
void apply_lint(ResultRecord& record, std::string_view rendered_findings);

} // namespace dockgrader

FMT_SERIALIZE_CLASS(::dockgrader::RecipeTargets, has_run, has_build);
