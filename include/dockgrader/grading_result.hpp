/// \file
/// Data classes describing test vectors and the result of one grading session
#pragma once

#include <dockgrader/common/formatters/macros.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace dockgrader {

/// Wall-clock span, in (fractional) seconds
using Seconds = std::chrono::duration<double>;

/// Final classification of a grading session
///
/// The numeric values are part of the wire format and must not change.
/// `Checking`, `LintError` and `Draft` are never produced by a GradingSession; they are reserved for the
/// surrounding service (e.g. marking a submission as queued, or as not yet submitted).
enum class Verdict {
    Ok = 0,
    Checking = 1,
    BuildError = 2,
    RuntimeError = 3,
    CheckError = 4,
    RuntimeTimeout = 6,
    BuildTimeout = 7,
    LintError = 8,
    Draft = 9,
};

/// One (input, expected-output) test case
struct TestVector
{
    std::string input;
    std::string expected_output;
};

/// Result of one grading session
///
/// Populated progressively: counts and message may be set even when the session ultimately fails,
/// so that partial progress can be reported.
struct ResultRecord
{
    Seconds check_time{};
    Seconds build_time{};

    Verdict status = Verdict::Checking;
    std::string message;

    int tests_passed{};
    int tests_total{};

    /// Only meaningful if status == Verdict::Ok
    bool lint_success{};

    constexpr bool passed() const noexcept { return status == Verdict::Ok; }
};

/// Durations are reported with a resolution of 0.1ms
inline double round_seconds(Seconds duration) {
    constexpr double RESOLUTION = 10'000.0;

    return std::round(duration.count() * RESOLUTION) / RESOLUTION;
}

} // namespace dockgrader

FMT_SERIALIZE_ENUM(::dockgrader::Verdict, Ok, Checking, BuildError, RuntimeError, CheckError, RuntimeTimeout,
                   BuildTimeout, LintError, Draft);
FMT_SERIALIZE_CLASS(::dockgrader::TestVector, input, expected_output);
FMT_SERIALIZE_CLASS(::dockgrader::ResultRecord, check_time, build_time, status, message, tests_passed, tests_total,
                    lint_success);
