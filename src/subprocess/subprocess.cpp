#include <dockgrader/subprocess/subprocess.hpp>

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/common/expected.hpp>
#include <dockgrader/common/linux.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <unistd.h>

namespace dockgrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// A child that exits without draining its stdin would otherwise kill us with SIGPIPE on the next write
void ignore_sigpipe_once() {
    static std::once_flag flag;

    std::call_once(flag, [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Could not ignore SIGPIPE: {}", res.error());
        }
    });
}

Result<void> set_nonblocking(int fd) {
    int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
         SyscallFailure);

    return {};
}

Result<void> close_fd(int& fd) {
    if (fd == -1) {
        return {};
    }

    int to_close = std::exchange(fd, -1);
    TRYE(linux::close(to_close), SyscallFailure);

    return {};
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, StderrMode stderr_mode)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , stderr_mode_{stderr_mode} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    std::ignore = close_pipes();

    if (is_alive()) {
        LOG_DEBUG("Killing still-running child {} ({}) on destruction", child_pid_, exec_);
        std::ignore = kill();
    }
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , stderr_mode_{other.stderr_mode_}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , exit_code_{std::exchange(other.exit_code_, std::nullopt)}
    , stdin_fd_{std::exchange(other.stdin_fd_, -1)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    stderr_mode_ = rhs.stderr_mode_;
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    exit_code_ = std::exchange(rhs.exit_code_, std::nullopt);
    stdin_fd_ = std::exchange(rhs.stdin_fd_, -1);
    stdout_fd_ = std::exchange(rhs.stdout_fd_, -1);
    stderr_fd_ = std::exchange(rhs.stderr_fd_, -1);

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess may only be started once", exec_);

    ignore_sigpipe_once();

    // O_CLOEXEC so that children forked concurrently from other threads never inherit our pipe ends;
    // otherwise EOF on stdout would not be seen until those unrelated children exit
    linux::Pipe stdin_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    linux::Pipe stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    linux::Pipe stderr_pipe{.read_fd = -1, .write_fd = -1};
    if (stderr_mode_ == StderrMode::Capture) {
        stderr_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    }

    // Build the argument list before forking; nothing past fork() in the child may allocate or log
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(const_cast<char*>(exec_.c_str()));
    for (const std::string& arg : args_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    LOG_TRACE("Spawning {} {}", exec_, args_);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        int err_target = stderr_mode_ == StderrMode::Merge ? stdout_pipe.write_fd : stderr_pipe.write_fd;

        if (::dup2(stdin_pipe.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe.write_fd, STDOUT_FILENO) == -1 ||
            ::dup2(err_target, STDERR_FILENO) == -1) {
            _exit(127);
        }

        ::execvp(exec_.c_str(), argv.data());

        // Same convention as the shell for "command not found"
        _exit(127);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Close the pipe ends being used in the child proc
    TRYE(linux::close(stdin_pipe.read_fd), SyscallFailure);
    TRYE(linux::close(stdout_pipe.write_fd), SyscallFailure);
    if (stderr_pipe.write_fd != -1) {
        TRYE(linux::close(stderr_pipe.write_fd), SyscallFailure);
    }

    stdin_fd_ = stdin_pipe.write_fd;
    stdout_fd_ = stdout_pipe.read_fd;
    stderr_fd_ = stderr_pipe.read_fd;

    TRY(set_nonblocking(stdin_fd_));
    TRY(set_nonblocking(stdout_fd_));
    if (stderr_fd_ != -1) {
        TRY(set_nonblocking(stderr_fd_));
    }

    LOG_TRACE("Started child {} ({})", child_pid_, exec_);

    return {};
}

Result<CommandOutput> Subprocess::communicate(std::string_view input) {
    ASSERT(child_pid_ != 0, "communicate() called before start()", exec_);

    CommandOutput output;
    std::size_t input_cursor = 0;

    if (input.empty()) {
        TRY(close_fd(stdin_fd_));
    }

    while (stdin_fd_ != -1 || stdout_fd_ != -1 || stderr_fd_ != -1) {
        std::vector<pollfd> fds;

        if (stdin_fd_ != -1) {
            fds.push_back({.fd = stdin_fd_, .events = POLLOUT, .revents = 0});
        }
        if (stdout_fd_ != -1) {
            fds.push_back({.fd = stdout_fd_, .events = POLLIN, .revents = 0});
        }
        if (stderr_fd_ != -1) {
            fds.push_back({.fd = stderr_fd_, .events = POLLIN, .revents = 0});
        }

        int num_ready = TRYE(linux::poll(fds, /*timeout_ms=*/-1), SyscallFailure);
        DEBUG_ASSERT(num_ready > 0);

        for (const pollfd& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }

            if (pfd.fd == stdin_fd_) {
                auto written = linux::write(stdin_fd_, input.substr(input_cursor));

                if (!written) {
                    if (written.error() == std::errc::resource_unavailable_try_again) {
                        continue;
                    }
                    if (written.error() == std::errc::broken_pipe) {
                        LOG_DEBUG("{} closed its stdin with {} bytes unwritten", exec_, input.size() - input_cursor);
                        TRY(close_fd(stdin_fd_));
                        continue;
                    }
                    return ErrorKind::SyscallFailure;
                }

                input_cursor += static_cast<std::size_t>(written.value());

                if (input_cursor == input.size()) {
                    TRY(close_fd(stdin_fd_));
                }

                continue;
            }

            int& fd = (pfd.fd == stdout_fd_) ? stdout_fd_ : stderr_fd_;
            std::string& buffer = (pfd.fd == stdout_fd_) ? output.out : output.err;

            auto chunk = linux::read(fd, READ_CHUNK_SIZE);

            if (!chunk) {
                if (chunk.error() == std::errc::resource_unavailable_try_again) {
                    continue;
                }
                return ErrorKind::SyscallFailure;
            }

            // EOF
            if (chunk.value().empty()) {
                TRY(close_fd(fd));
                continue;
            }

            buffer += chunk.value();
        }
    }

    output.exit_code = TRY(wait_for_exit());

    LOG_TRACE("Child {} ({}) exited with {}; {} bytes of output", child_pid_, exec_, output.exit_code,
              output.out.size());

    return output;
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    TRY(close_pipes());
    TRY(wait_for_exit());

    return {};
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !exit_code_.has_value();
}

Result<void> Subprocess::close_pipes() {
    TRY(close_fd(stdin_fd_));
    TRY(close_fd(stdout_fd_));
    TRY(close_fd(stderr_fd_));

    return {};
}

Result<int> Subprocess::wait_for_exit() {
    if (exit_code_) {
        return *exit_code_;
    }

    linux::WaitStatus status = TRYE(linux::waitpid(child_pid_), SyscallFailure);

    // Shell convention for processes terminated by a signal
    constexpr int SIGNALED_EXIT_BASE = 128;

    if (status.kind == linux::WaitStatus::Signaled) {
        exit_code_ = SIGNALED_EXIT_BASE + status.code;
    } else {
        exit_code_ = status.code;
    }

    return *exit_code_;
}

Result<CommandOutput> run_command(const std::string& exec, const std::vector<std::string>& args,
                                  std::string_view input, Subprocess::StderrMode stderr_mode) {
    Subprocess proc{exec, args, stderr_mode};

    TRY(proc.start());

    return proc.communicate(input);
}

} // namespace dockgrader
