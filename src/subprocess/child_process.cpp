#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/subprocess/child_process.hpp>
#include <gradebox/subprocess/exit_status.hpp>

#include "subprocess/spawn_status.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef CLOSE_RANGE_CLOEXEC
// From <linux/close_range.h>, which older userspace headers lack
#define CLOSE_RANGE_CLOEXEC (1U << 2)
#endif

namespace gradebox {

namespace {

using detail::ChildStep;
using detail::StatusReport;

/// Everything the forked child needs, prepared before fork.
/// After fork the child may only make async-signal-safe calls, so nothing here allocates.
struct ChildSetup
{
    const char* path;
    char* const* argv;
    char* const* envp;
    const char* working_dir;

    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int status_fd;

    pid_t parent_pid;
    rlim_t cpu_limit_seconds;
    int max_fd;
};

[[noreturn]] void report_and_exit(int status_fd, ChildStep step, int err = errno) {
    // Nothing else can be done if this write fails too
    [[maybe_unused]] bool reported = detail::write_status_report(status_fd, step, err);

    ::_exit(127);
}

/// Move `fd` to a number >= 3, so that installing the standard streams can't clobber it
int lift_above_stdio(int fd, int status_fd) {
    if (fd > STDERR_FILENO) {
        return fd;
    }

    // NOLINTNEXTLINE(*vararg)
    int lifted = ::fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    if (lifted == -1) {
        report_and_exit(status_fd, ChildStep::RedirectStdio);
    }
    return lifted;
}

/// Runs in the forked child. Never returns.
[[noreturn]] void exec_child(const ChildSetup& setup) {
    int status_fd = setup.status_fd;
    if (status_fd <= STDERR_FILENO) {
        // NOLINTNEXTLINE(*vararg)
        int lifted = ::fcntl(status_fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
        if (lifted == -1) {
            report_and_exit(status_fd, ChildStep::RedirectStdio);
        }
        status_fd = lifted;
    }

    if (::setpgid(0, 0) == -1) {
        report_and_exit(status_fd, ChildStep::SetProcessGroup);
    }

    // Fires when the forking *thread* exits, which the supervisor never does before the child dies
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) { // NOLINT(*vararg)
        report_and_exit(status_fd, ChildStep::ParentDeathSignal);
    }
    // The parent may have died before the prctl took effect
    if (::getppid() != setup.parent_pid) {
        report_and_exit(status_fd, ChildStep::ParentDeathSignal, ESRCH);
    }

    // Ignored dispositions and blocked signals survive exec; start the child from a clean slate
    struct sigaction default_action {};
    default_action.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; ++sig) {
        // Fails for SIGKILL, SIGSTOP and the reserved real-time signals, which is fine
        ::sigaction(sig, &default_action, nullptr);
    }

    sigset_t empty_mask;
    ::sigemptyset(&empty_mask);
    if (::sigprocmask(SIG_SETMASK, &empty_mask, nullptr) == -1) {
        report_and_exit(status_fd, ChildStep::ResetSignals);
    }

    struct rlimit no_core {
        .rlim_cur = 0, .rlim_max = 0
    };
    if (::setrlimit(RLIMIT_CORE, &no_core) == -1) {
        report_and_exit(status_fd, ChildStep::ResourceLimits);
    }

    if (setup.cpu_limit_seconds > 0) {
        // SIGXCPU at the soft limit, SIGKILL a second later
        struct rlimit cpu {
            .rlim_cur = setup.cpu_limit_seconds, .rlim_max = setup.cpu_limit_seconds + 1
        };
        if (::setrlimit(RLIMIT_CPU, &cpu) == -1) {
            report_and_exit(status_fd, ChildStep::ResourceLimits);
        }
    }

    int stdin_fd = lift_above_stdio(setup.stdin_fd, status_fd);
    int stdout_fd = lift_above_stdio(setup.stdout_fd, status_fd);
    int stderr_fd = lift_above_stdio(setup.stderr_fd, status_fd);

    if (::dup2(stdin_fd, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_fd, STDERR_FILENO) == -1) {
        report_and_exit(status_fd, ChildStep::RedirectStdio);
    }

    if (::chdir(setup.working_dir) == -1) {
        report_and_exit(status_fd, ChildStep::ChangeDir);
    }

    // Nothing but the standard streams may cross the exec. The status pipe is already close-on-exec.
    bool marked = false;
#ifdef SYS_close_range
    // NOLINTNEXTLINE(*vararg)
    marked = ::syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, CLOSE_RANGE_CLOEXEC) == 0;
#endif
    if (!marked) {
        for (int fd = STDERR_FILENO + 1; fd < setup.max_fd; ++fd) {
            ::fcntl(fd, F_SETFD, FD_CLOEXEC); // NOLINT(*vararg)
        }
    }

    ::execve(setup.path, setup.argv, setup.envp);

    report_and_exit(status_fd, ChildStep::Exec);
}

/// NULL-terminated array of pointers into `strings`, which must outlive the result
std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> res;
    res.reserve(strings.size() + 1);
    for (auto& str : strings) {
        res.push_back(str.data());
    }
    res.push_back(nullptr);
    return res;
}

int open_file_limit() {
    struct rlimit lim {};
    if (::getrlimit(RLIMIT_NOFILE, &lim) == -1 || lim.rlim_cur == RLIM_INFINITY) {
        return 1024 * 1024;
    }
    return gsl::narrow_cast<int>(lim.rlim_cur);
}

void close_fd(int& fd) {
    if (fd == -1) {
        return;
    }

    if (auto res = linux::close(fd); !res) {
        LOG_WARN("Failed to close fd {}: '{}'", fd, res.error().message());
    }

    fd = -1;
}

/// Wait for the child's exec to resolve. EOF on the status pipe means the exec happened.
} // namespace

Expected<ChildProcess, SpawnError> ChildProcess::spawn(const SpawnOptions& opts) {
    ASSERT(!opts.executable.empty() && opts.executable.front() == '/', opts.executable);

    std::vector<std::string> argv_storage{opts.executable};
    argv_storage.insert(argv_storage.end(), opts.args.begin(), opts.args.end());
    std::vector<std::string> envp_storage = opts.env;

    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(envp_storage);

    LOG_DEBUG("Spawning {} in {:?} with {} environment variables", fmt::join(argv_storage, " "), opts.working_dir,
              envp_storage.size());

    ChildProcess child;

    // The child's ends of its stdio, plus the status pipe. Closed in the parent once forked.
    int child_stdin = -1;
    int child_stdout = -1;
    int child_stderr = -1;
    int status_read = -1;
    int status_write = -1;
    auto close_locals = gsl::finally([&] {
        for (int* fd : {&child_stdin, &child_stdout, &child_stderr, &status_read, &status_write}) {
            close_fd(*fd);
        }
    });

    auto fail = [](std::string_view step, const std::error_code& err) {
        LOG_WARN("Could not spawn child: {} failed: '{}'", step, err.message());
        return SpawnError{.step = step, .error = err};
    };

    auto stdout_pipe = linux::pipe2(O_CLOEXEC);
    if (!stdout_pipe) {
        return fail("pipe2", stdout_pipe.error());
    }
    child.stdout_fd_ = stdout_pipe->read_fd;
    child_stdout = stdout_pipe->write_fd;

    auto stderr_pipe = linux::pipe2(O_CLOEXEC);
    if (!stderr_pipe) {
        return fail("pipe2", stderr_pipe.error());
    }
    child.stderr_fd_ = stderr_pipe->read_fd;
    child_stderr = stderr_pipe->write_fd;

    auto status_pipe = linux::pipe2(O_CLOEXEC);
    if (!status_pipe) {
        return fail("pipe2", status_pipe.error());
    }
    status_read = status_pipe->read_fd;
    status_write = status_pipe->write_fd;

    if (opts.stdin_data) {
        // A socket rather than a pipe, so that writing after the child exits gives EPIPE via
        // MSG_NOSIGNAL instead of raising SIGPIPE in this process
        auto sockets = linux::socketpair(SOCK_CLOEXEC);
        if (!sockets) {
            return fail("socketpair", sockets.error());
        }
        child.stdin_fd_ = sockets->parent_fd;
        child_stdin = sockets->child_fd;
    } else {
        auto devnull = linux::open("/dev/null", O_RDONLY | O_CLOEXEC); // NOLINT(*-signed-bitwise)
        if (!devnull) {
            return fail("open(/dev/null)", devnull.error());
        }
        child_stdin = *devnull;
    }

    const ChildSetup setup{.path = argv_storage.front().c_str(),
                           .argv = argv.data(),
                           .envp = envp.data(),
                           .working_dir = opts.working_dir.c_str(),
                           .stdin_fd = child_stdin,
                           .stdout_fd = child_stdout,
                           .stderr_fd = child_stderr,
                           .status_fd = status_write,
                           .parent_pid = ::getpid(),
                           .cpu_limit_seconds = static_cast<rlim_t>(opts.cpu_limit_seconds),
                           .max_fd = open_file_limit()};

    auto fork_res = linux::fork();
    if (!fork_res) {
        return fail("fork", fork_res.error());
    }

    if (fork_res->which == linux::Fork::Child) {
        exec_child(setup);
    }

    child.pid_ = fork_res->pid;

    // Also done in the child; whichever runs first wins, so killpg works immediately.
    // Fails with EACCES once the child has exec'd, by which point the child has done it itself.
    if (auto res = linux::setpgid(child.pid_, child.pid_); !res) {
        LOG_TRACE("setpgid from the parent failed (benign): '{}'", res.error().message());
    }

    for (int* fd : {&child_stdin, &child_stdout, &child_stderr, &status_write}) {
        close_fd(*fd);
    }

    auto report = detail::read_status_report(status_read);
    if (!report) {
        return fail("read(status pipe)", report.error());
    }

    if (report->has_value()) {
        const StatusReport& failure = **report;

        // The child has already exited; reap it now rather than killing a group that no longer exists
        if (auto res = child.reap(); !res) {
            LOG_WARN("Failed to reap child {} after its setup failed: '{}'", child.pid_, res.error().message());
        }

        return fail(detail::child_step_name(failure.step), linux::make_error_code(failure.err));
    }

    child.start_time_ = std::chrono::steady_clock::now();

    auto pidfd = linux::pidfd_open(child.pid_);
    if (!pidfd) {
        // `child` kills and reaps on the way out
        return fail("pidfd_open", pidfd.error());
    }
    child.pidfd_ = *pidfd;

    for (int fd : {child.stdout_fd_, child.stderr_fd_, child.stdin_fd_}) {
        if (fd == -1) {
            continue;
        }
        if (auto res = linux::set_nonblocking(fd); !res) {
            return fail("fcntl(O_NONBLOCK)", res.error());
        }
    }

    LOG_DEBUG("Child {} is running", child.pid_);

    return child;
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_{std::exchange(other.pid_, 0)}
    , pidfd_{std::exchange(other.pidfd_, -1)}
    , stdin_fd_{std::exchange(other.stdin_fd_, -1)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)}
    , start_time_{other.start_time_}
    , exit_status_{std::exchange(other.exit_status_, std::nullopt)} {}

ChildProcess& ChildProcess::operator=(ChildProcess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    release();

    pid_ = std::exchange(rhs.pid_, 0);
    pidfd_ = std::exchange(rhs.pidfd_, -1);
    stdin_fd_ = std::exchange(rhs.stdin_fd_, -1);
    stdout_fd_ = std::exchange(rhs.stdout_fd_, -1);
    stderr_fd_ = std::exchange(rhs.stderr_fd_, -1);
    start_time_ = rhs.start_time_;
    exit_status_ = std::exchange(rhs.exit_status_, std::nullopt);

    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

void ChildProcess::release() noexcept {
    // pid_ == 0 -> moved from, or the fork never happened
    if (pid_ != 0 && !exit_status_) {
        LOG_DEBUG("Child {} still unreaped on release; killing its process group", pid_);

        if (auto res = kill_group(SIGKILL); !res) {
            LOG_WARN("Failed to kill process group {}: '{}'", pid_, res.error().message());
        }
        if (auto res = reap(); !res) {
            LOG_ERROR("Failed to reap child {}: '{}'", pid_, res.error().message());
        }
    }

    close_fd(pidfd_);
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    pid_ = 0;
    exit_status_.reset();
}

Expected<> ChildProcess::kill_group(int sig) {
    if (pid_ == 0 || exit_status_) {
        return {};
    }

    auto res = linux::killpg(pid_, sig);

    // ESRCH: every member of the group is already gone
    if (!res && res.error() != std::errc::no_such_process) {
        return res.error();
    }

    return {};
}

Expected<std::optional<ExitStatus>> ChildProcess::try_reap() {
    if (exit_status_) {
        return exit_status_;
    }

    auto info = linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid_), WEXITED | WNOHANG);
    if (!info) {
        return info.error();
    }

    // WNOHANG with no state change leaves si_pid zeroed
    if (info->si_pid == 0) {
        return std::nullopt;
    }

    exit_status_ = ExitStatus::from_siginfo(*info);
    LOG_DEBUG("Child {} {}", pid_, *exit_status_);

    return exit_status_;
}

Expected<ExitStatus> ChildProcess::reap() {
    if (exit_status_) {
        return *exit_status_;
    }

    while (true) {
        auto info = linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid_), WEXITED);

        if (!info) {
            if (info.error() == std::errc::interrupted) {
                continue;
            }
            return info.error();
        }

        exit_status_ = ExitStatus::from_siginfo(*info);
        LOG_DEBUG("Child {} {}", pid_, *exit_status_);

        return *exit_status_;
    }
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

void ChildProcess::close_stdout() {
    close_fd(stdout_fd_);
}

void ChildProcess::close_stderr() {
    close_fd(stderr_fd_);
}

} // namespace gradebox
