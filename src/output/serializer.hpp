#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <dockgrader/common/class_traits.hpp>
#include <dockgrader/grader_config.hpp>
#include <dockgrader/grading_result.hpp>

#include <string_view>

namespace dockgrader {

/// Renders the outcome of a grading run to a Sink
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    /// Called once before grading starts
    virtual void on_session_begin(const GraderConfig& config, int num_vectors) = 0;

    /// Called once with the final result of a graded session
    virtual void on_result(const ResultRecord& result) = 0;

    /// Grading could not be performed
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace dockgrader
