#include <dockgrader/grading_session.hpp>

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/container/environment.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/lint/linter.hpp>
#include <dockgrader/logging.hpp>
#include <dockgrader/phase_supervisor.hpp>
#include <dockgrader/staging/staging_area.hpp>
#include <dockgrader/test_runner.hpp>
#include <dockgrader/verdict_classifier.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dockgrader {

GradingSession::GradingSession(ContainerEngine& engine, Linter& linter, GraderConfig config)
    : engine_{&engine}
    , linter_{&linter}
    , config_{std::move(config)} {}

ResultRecord GradingSession::grade(const FileMap& submission, const std::vector<TestVector>& vectors) {
    const int tests_total = gsl::narrow_cast<int>(vectors.size());

    auto [targets, rejection] = validate_recipe(submission, config_.recipe_file, tests_total);

    if (rejection) {
        LOG_INFO("Submission rejected before provisioning: {}", rejection->message);
        return std::move(*rejection);
    }

    StagingArea staging{config_.staging_root};

    const ContainerSpec spec{
        .image = config_.image,
        .volumes = {{.host_path = staging.get_input_dir().string(),
                     .container_path = config_.input_mount_dir,
                     .read_only = true}},
        .network_disabled = true,
        .memory_limit = config_.memory_limit,
    };

    Environment env{*engine_, spec};

    // The environment goes first; it still has the staging directory mounted
    auto teardown = gsl::finally([&env] { env.destroy(); });

    // e.g. "/root/source" is injected as "source/..." extracted into "/root"
    const std::filesystem::path source_dir{config_.source_dir};
    env.inject(submission, source_dir.filename().string(), source_dir.parent_path().string());

    ResultRecord record = run_phases(env, staging, targets.has_build, vectors);

    if (record.status == Verdict::Ok) {
        const auto findings = linter_->analyze(submission);
        apply_lint(record, linter_->render(findings));
    }

    LOG_INFO("Verdict: {} ({}/{} tests passed, build {}, check {})", record.status, record.tests_passed,
             record.tests_total, record.build_time, record.check_time);

    return record;
}

ResultRecord GradingSession::run_phases(Environment& env, StagingArea& staging, bool needs_build,
                                        const std::vector<TestVector>& vectors) {
    const int tests_total = gsl::narrow_cast<int>(vectors.size());

    Seconds build_time{};

    if (needs_build) {
        const std::vector<std::string> build_argv{"/bin/sh", "-c", config_.build_command};

        PhaseOutcome<ExecResult> build = PhaseSupervisor{env, "build"}.supervise(
            config_.build_timeout, [&env, &build_argv, this] { return env.execute(build_argv, config_.source_dir); });

        // A timed out build leaves a terminated environment behind, so testing is out of the question
        if (auto failed = classify_build(build, tests_total)) {
            return std::move(*failed);
        }

        build_time = build.elapsed;
    } else {
        LOG_DEBUG("No build target; skipping build phase");
    }

    const Seconds test_budget = config_.test_phase_budget(vectors.size());

    PhaseOutcome<ResultRecord> test = PhaseSupervisor{env, "test"}.supervise(test_budget, [&, this] {
        TestRunner runner{env, staging, config_};
        return runner.run(vectors);
    });

    ResultRecord record = classify_test(std::move(test), tests_total);
    record.build_time = build_time;

    return record;
}

} // namespace dockgrader
