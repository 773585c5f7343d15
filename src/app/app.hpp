#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <dockgrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace dockgrader {

/// Process exit codes
enum ExitCode : int {
    EXIT_PASSED = 0,
    EXIT_FAILED = 1,
    /// Grading could not be performed; also used for unhandled exceptions and usage errors
    EXIT_NOT_GRADED = 2,
};

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_NOT_GRADED);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace dockgrader
