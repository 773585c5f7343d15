#pragma once

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/container/environment.hpp>
#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/staging/staging_area.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dockgrader {

/// Strips exactly one trailing '\n' from ``answer`` iff ``expected`` does not end with one.
/// This is the only normalization applied before comparing outputs.
std::string_view canonicalize_answer(std::string_view answer, std::string_view expected);

/// Whether ``answer`` is accepted for ``expected``
bool answers_match(std::string_view answer, std::string_view expected);

/// Runs test vectors one after the other inside a live environment, stopping at the first failure
///
/// Never throws for anything the submission does; failures of the environment's engine or of the
/// staging area are thrown as GradingInfrastructureError.
class TestRunner
{
public:
    TestRunner(Environment& env, StagingArea& staging, const GraderConfig& config);

    /// Verdict is one of Ok, RuntimeError or CheckError. tests_passed is the number of vectors
    /// strictly before the first failing one.
    ResultRecord run(const std::vector<TestVector>& vectors);

    /// Shell command executing the submission's `run` target for a single vector
    static std::vector<std::string> make_run_command(const GraderConfig& config);

    /// Environment variables passed to the run command
    static EnvVars make_run_env(const GraderConfig& config);

private:
    enum class VectorOutcome { Passed, Failed };

    VectorOutcome run_one(const TestVector& vector, ResultRecord& record);

    Environment* env_;
    StagingArea* staging_;
    const GraderConfig* config_;
};

} // namespace dockgrader
