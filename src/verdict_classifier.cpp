#include <dockgrader/verdict_classifier.hpp>

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/logging.hpp>
#include <dockgrader/phase_supervisor.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dockgrader {

RecipeTargets inspect_recipe(std::string_view recipe) {
    return {.has_run = recipe.find("run:") != std::string_view::npos,
            .has_build = recipe.find("build:") != std::string_view::npos};
}

RecipeValidation validate_recipe(const FileMap& files, std::string_view recipe_name, int tests_total) {
    auto reject = [tests_total](std::string message) {
        return RecipeValidation{.targets = {},
                                .rejection = ResultRecord{.status = Verdict::BuildError,
                                                          .message = std::move(message),
                                                          .tests_total = tests_total}};
    };

    auto recipe = files.find(std::string{recipe_name});

    if (recipe == files.end()) {
        return reject(fmt::format("No {} found!", recipe_name));
    }

    RecipeTargets targets = inspect_recipe(recipe->second);
    LOG_DEBUG("{} declares {}", recipe_name, targets);

    if (!targets.has_run) {
        return reject(fmt::format(R"({} must contain "run:")", recipe_name));
    }

    return {.targets = targets, .rejection = std::nullopt};
}

std::optional<ResultRecord> classify_build(const PhaseOutcome<ExecResult>& build, int tests_total) {
    if (!build.completed) {
        return ResultRecord{.build_time = build.elapsed, .status = Verdict::BuildTimeout, .tests_total = tests_total};
    }

    if (build.value->exit_code != 0) {
        return ResultRecord{.build_time = build.elapsed,
                            .status = Verdict::BuildError,
                            .message = build.value->output,
                            .tests_total = tests_total};
    }

    return std::nullopt;
}

ResultRecord classify_test(PhaseOutcome<ResultRecord> test, int tests_total) {
    ResultRecord record;

    if (test.completed) {
        record = std::move(*test.value);
        DEBUG_ASSERT(record.tests_total == tests_total, record, tests_total);
    } else {
        // The abandoned runner's progress cannot be trusted, so nothing counts as passed
        record = ResultRecord{.status = Verdict::RuntimeTimeout, .tests_passed = 0, .tests_total = tests_total};
    }

    record.check_time = test.elapsed;

    return record;
}

void apply_lint(ResultRecord& record, std::string_view rendered_findings) {
    ASSERT(record.status == Verdict::Ok, record);

    record.lint_success = rendered_findings.empty();

    if (!record.lint_success) {
        record.message += '\n';
        record.message += rendered_findings;
    }
}

} // namespace dockgrader
