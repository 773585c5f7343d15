#include "app/grader_app.hpp"

#include "output/json_serializer.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"
#include "user/submission_loader.hpp"

#include <dockgrader/container/docker_cli_engine.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/grading_session.hpp>
#include <dockgrader/lint/style_linter.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <memory>
#include <string>
#include <vector>

namespace dockgrader {

std::unique_ptr<Serializer> GraderApp::make_serializer(Sink& sink) const {
    if (OPTS.output_format == ProgramOptions::OutputFormat::Json) {
        return std::make_unique<JsonSerializer>(sink);
    }

    return std::make_unique<PlainTextSerializer>(sink, OPTS.colorize_option, OPTS.verbosity);
}

int GraderApp::run_impl() {
    StdoutSink output_sink;
    std::unique_ptr<Serializer> serializer = make_serializer(output_sink);

    auto finalize = gsl::finally([&serializer] { serializer->finalize(); });

    auto submission = load_submission(OPTS.submission_path);
    if (!submission) {
        serializer->on_error(submission.error());
        return EXIT_NOT_GRADED;
    }

    auto vectors = load_test_vectors(OPTS.tests_path);
    if (!vectors) {
        serializer->on_error(vectors.error());
        return EXIT_NOT_GRADED;
    }

    DockerCliEngine engine{OPTS.docker_exec};
    StyleLinter linter;
    GradingSession session{engine, linter, OPTS.to_grader_config()};

    LOG_DEBUG("Grading {} with {}", OPTS.submission_path, session.get_config());
    serializer->on_session_begin(session.get_config(), gsl::narrow_cast<int>(vectors->size()));

    ResultRecord result;

    try {
        result = session.grade(*submission, *vectors);
    } catch (const GradingInfrastructureError& ex) {
        LOG_ERROR("Grading failed: {}", ex);
        serializer->on_error(fmt::format("Could not grade submission: {}", ex.what()));
        return EXIT_NOT_GRADED;
    }

    serializer->on_result(result);

    return result.passed() ? EXIT_PASSED : EXIT_FAILED;
}

} // namespace dockgrader
