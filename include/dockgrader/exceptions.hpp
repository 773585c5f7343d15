#pragma once

#include <dockgrader/common/error_types.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace dockgrader {

/// Base for failures of the infrastructure around a grading session (container engine, archiving, staging)
///
/// These are never verdicts: when one is thrown, the submission was not graded.
class GradingInfrastructureError : public std::runtime_error
{
public:
    explicit GradingInfrastructureError(const std::string& msg, ErrorKind error = ErrorKind::UnknownError)
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; };

private:
    ErrorKind error_;
};

/// The isolated environment could not be created
class ProvisionError : public GradingInfrastructureError
{
public:
    using GradingInfrastructureError::GradingInfrastructureError;
};

/// Submission files could not be copied into the environment
class InjectionError : public GradingInfrastructureError
{
public:
    using GradingInfrastructureError::GradingInfrastructureError;
};

/// Submission files could not be packed into a transfer archive
class ArchiveError : public GradingInfrastructureError
{
public:
    using GradingInfrastructureError::GradingInfrastructureError;
};

/// A request to a live environment failed at the engine level (not a failure of the command run inside it)
class EngineError : public GradingInfrastructureError
{
public:
    using GradingInfrastructureError::GradingInfrastructureError;
};

/// Host-side staging directory could not be prepared or written
class StagingError : public GradingInfrastructureError
{
public:
    using GradingInfrastructureError::GradingInfrastructureError;
};

} // namespace dockgrader

template <>
struct fmt::formatter<::dockgrader::GradingInfrastructureError> : ::dockgrader::DebugFormatter
{
    auto format(const ::dockgrader::GradingInfrastructureError& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};
