#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/subprocess/exit_status.hpp>

#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sys/types.h>

namespace gradebox {

/// Everything needed to start a child process
struct SpawnOptions
{
    /// Absolute path; no PATH lookup is done
    std::string executable;

    /// argv[1..]; argv[0] is always `executable`
    std::vector<std::string> args;

    /// The child's complete environment, as "KEY=VALUE" strings
    std::vector<std::string> env;

    /// Directory the child starts in
    std::string working_dir;

    /// If set, written to the child's stdin (which then sees EOF). Otherwise stdin is /dev/null.
    std::optional<std::string> stdin_data;

    /// RLIMIT_CPU backstop in seconds; 0 means no limit
    int cpu_limit_seconds = 0;
};

/// Why a child process could not be started
struct SpawnError
{
    /// The operation that failed, e.g. "fork" or "execve"
    std::string_view step;
    std::error_code error;

    friend std::string format_as(const SpawnError& from) {
        return fmt::format("{} failed: {}", from.step, from.error.message());
    }
};

/// Exclusive handle to a running (or exited, not yet reaped) child process.
///
/// The child leads its own process group, so it and every descendant that stays in the group can
/// be signalled at once. The handle never outlives the process: destroying it kills the whole
/// group and reaps the child if that has not already happened.
class ChildProcess : public NonCopyable
{
public:
    /// Start a child per `opts`. Returns once the exec has succeeded (or failed).
    static Expected<ChildProcess, SpawnError> spawn(const SpawnOptions& opts);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& rhs) noexcept;
    ~ChildProcess();

    pid_t pid() const { return pid_; }

    /// Readable once the child has exited. See pidfd_open(2)
    int pidfd() const { return pidfd_; }

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    /// Write end of the child's stdin, or -1 if stdin is /dev/null (or was already closed)
    int stdin_fd() const { return stdin_fd_; }

    /// When the exec was confirmed
    std::chrono::steady_clock::time_point start_time() const { return start_time_; }

    /// Send `sig` to every process in the child's group.
    /// Does nothing once the child has been reaped, since its group id may then be reused.
    Expected<> kill_group(int sig = SIGKILL);

    /// Non-blocking; `std::nullopt` if the child is still running
    Expected<std::optional<ExitStatus>> try_reap();

    /// Blocks until the child has terminated
    Expected<ExitStatus> reap();

    std::optional<ExitStatus> exit_status() const { return exit_status_; }

    void close_stdin();
    void close_stdout();
    void close_stderr();

private:
    ChildProcess() = default;

    /// Kill, reap and close everything still held. Leaves the object in the moved-from state.
    void release() noexcept;

    pid_t pid_ = 0;
    int pidfd_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::chrono::steady_clock::time_point start_time_;
    std::optional<ExitStatus> exit_status_;
};

} // namespace gradebox
