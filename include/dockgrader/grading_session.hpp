#pragma once

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/file_map.hpp>
#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/lint/linter.hpp>

#include <vector>

namespace dockgrader {

class Environment;
class StagingArea;

/// Grades one submission from start to finish:
///   validate recipe -> provision -> [build] -> test -> [lint] -> teardown
///
/// Anything the submission does (failing to build, crashing, running out of time, killing its environment,
/// printing the wrong answer) ends up in the returned ResultRecord. A GradingInfrastructureError is thrown
/// instead when grading could not be performed at all, e.g. the environment could not be provisioned or the
/// submission could not be copied into it. Once provisioned, the environment and staging directory are
/// released on every path.
class GradingSession
{
public:
    GradingSession(ContainerEngine& engine, Linter& linter, GraderConfig config);

    /// ``submission`` maps paths relative to the submission root to file contents
    ResultRecord grade(const FileMap& submission, const std::vector<TestVector>& vectors);

    const GraderConfig& get_config() const { return config_; }

private:
    ResultRecord run_phases(Environment& env, StagingArea& staging, bool needs_build,
                            const std::vector<TestVector>& vectors);

    ContainerEngine* engine_;
    Linter* linter_;
    GraderConfig config_;
};

} // namespace dockgrader
