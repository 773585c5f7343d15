#pragma once

#include <dockgrader/common/class_traits.hpp>
#include <dockgrader/common/error_types.hpp>
#include <dockgrader/common/linux.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace dockgrader {

/// Everything a finished child process produced
struct CommandOutput
{
    /// Exit code of the process, or 128 + signal number if it was killed by a signal (shell convention)
    int exit_code{};
    std::string out;
    /// Always empty if stderr was merged into stdout
    std::string err;
};

/// A child process with pipes connected to its stdin, stdout and (optionally) stderr
class Subprocess : NonCopyable
{
public:
    enum class StderrMode {
        Merge,   ///< stderr is redirected into the stdout pipe
        Capture, ///< stderr is read through its own pipe
    };

    /// ``exec`` is searched for in PATH if it does not contain a slash.
    /// The child inherits the environment of this process.
    Subprocess(std::string exec, std::vector<std::string> args, StderrMode stderr_mode = StderrMode::Capture);
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    Result<void> start();

    /// Writes all of ``input`` to the child's stdin, then closes it, while concurrently collecting stdout / stderr
    /// until the child closes them. Blocks until the child has exited.
    Result<CommandOutput> communicate(std::string_view input = {});

    /// Forcefully kill the child process and reap it
    Result<void> kill();

    /// Whether the process is still running (not yet reaped)
    bool is_alive() const;


private:
    Result<void> close_pipes();
    Result<int> wait_for_exit();

    std::string exec_;
    std::vector<std::string> args_;
    StderrMode stderr_mode_;

    pid_t child_pid_{};
    std::optional<int> exit_code_;

    // Parent-side ends; -1 when closed
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
};

/// Convenience wrapper: start ``exec`` with ``args``, feed it ``input`` and wait for it to finish
Result<CommandOutput> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  std::string_view input = {},
                                  Subprocess::StderrMode stderr_mode = Subprocess::StderrMode::Capture);

} // namespace dockgrader
