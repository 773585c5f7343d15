#pragma once

namespace dockgrader {

/// How much of a result is written out by the plain text serializer.
/// Machine-readable output (JSON) is unaffected. `Max` is just used as a sentinal.
enum class VerbosityLevel {
    Silent,  ///< Nothing but errors; the exit code carries the verdict
    Quiet,   ///< One line: verdict and test count
    Summary, ///< Verdict, counts and the message
    All,     ///< Everything, including timings
    Max
};

constexpr bool should_output_verdict(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_message(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_timings(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

} // namespace dockgrader
