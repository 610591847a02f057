#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gradebox::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// Whether `err` is the error a non-blocking descriptor reports when it has nothing to offer
inline bool is_would_block(const std::error_code& err) {
    return err == std::errc::resource_unavailable_try_again || err == std::errc::operation_would_block;
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return gsl::narrow_cast<std::size_t>(res);
}

/// sends on a connected socket. See send(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::size_t> send(int fd, std::string_view data, int flags) {
    ssize_t res = ::send(fd, data.data(), data.size(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("send failed: '{}'", err.message());
        return err;
    }

    return gsl::narrow_cast<std::size_t>(res);
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level (except for EAGAIN, which is routine)
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (!is_would_block(err)) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(gsl::narrow_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see killpg(3)
/// returns success/failure; logs failure at debug level
inline Expected<> killpg(pid_t pgrp, int sig) {
    int res = ::killpg(pgrp, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("killpg failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see setpgid(2)
/// returns success/failure; logs failure at debug level
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err.message());
        return err;
    }

    return {};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    int pipefd[2] = {-1, -1}; // NOLINT(*-avoid-c-arrays)

    int res = ::pipe2(pipefd, flags); // NOLINT(*-array-to-pointer-decay)

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err.message());
        return err;
    }

    return Pipe{.read_fd = pipefd[0], .write_fd = pipefd[1]};
}

struct SocketPair
{
    int parent_fd = -1;
    int child_fd = -1;
};

/// see socketpair(2). Always a connected AF_UNIX stream pair.
/// returns success/failure; logs failure at debug level
inline Expected<SocketPair> socketpair(int extra_type_flags = 0) {
    int fds[2] = {-1, -1}; // NOLINT(*-avoid-c-arrays)

    int res = ::socketpair(AF_UNIX, SOCK_STREAM | extra_type_flags, 0, fds); // NOLINT(*-array-to-pointer-decay)

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("socketpair failed: '{}'", err.message());
        return err;
    }

    return SocketPair{.parent_fd = fds[0], .child_fd = fds[1]};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// Nothing is logged in the child; only async-signal-safe work may follow there.
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, int arg = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::fcntl(fd, cmd, arg);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// Add O_NONBLOCK to the status flags of `fd`
inline Expected<> set_nonblocking(int fd) {
    auto flags = fcntl(fd, F_GETFL);
    if (!flags) {
        return flags.error();
    }

    if (auto res = fcntl(fd, F_SETFL, flags.value() | O_NONBLOCK); !res) { // NOLINT(*-signed-bitwise)
        return res.error();
    }

    return {};
}

/// see waitid(2)
/// returns success/failure; logs failure at debug level
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options) {
    siginfo_t info{};

    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::interrupted) {
            LOG_DEBUG("poll failed: '{}'", err.message());
        }

        return err;
    }

    return res;
}

/// see pidfd_open(2). Requires Linux >= 5.3
/// returns success/failure; logs failure at debug level
inline Expected<int> pidfd_open(pid_t pid) {
#ifdef SYS_pidfd_open
    // NOLINTNEXTLINE(*vararg)
    auto res = static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pidfd_open failed: '{}'", err.message());

        return err;
    }

    return res;
#else
    LOG_DEBUG("pidfd_open is not available in this build (pid={})", pid);
    return make_error_code(ENOSYS);
#endif
}

/// see eventfd(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> eventfd(unsigned int initval, int flags) {
    int res = ::eventfd(initval, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("eventfd failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see mkdtemp(3). `templ` must end with "XXXXXX"
/// returns the created directory's path; logs failure at debug level
inline Expected<std::string> mkdtemp(std::string templ) {
    if (::mkdtemp(templ.data()) == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp failed: '{}'", err.message());

        return err;
    }

    return templ;
}

#define SIGSTRCASE(sig)                                                                                                \
    case sig:                                                                                                          \
        return #sig;
// Value type to behave as a linux signal
class Signal
{
public:
    Signal(int signal_num) // NOLINT(*-explicit-*)
        : signal_num_{signal_num} {};

    operator int() const { return signal_num_; } // NOLINT(*-explicit-*)

    std::string to_string() const {
        // Signals obtained from the output of `kill -l` on bash
        switch (signal_num_) {
            SIGSTRCASE(SIGHUP)
            SIGSTRCASE(SIGINT)
            SIGSTRCASE(SIGQUIT)
            SIGSTRCASE(SIGILL)
            SIGSTRCASE(SIGTRAP)
            SIGSTRCASE(SIGABRT)
            SIGSTRCASE(SIGBUS)
            SIGSTRCASE(SIGFPE)
            SIGSTRCASE(SIGKILL)
            SIGSTRCASE(SIGSEGV)
            SIGSTRCASE(SIGPIPE)
            SIGSTRCASE(SIGALRM)
            SIGSTRCASE(SIGTERM)
            SIGSTRCASE(SIGCHLD)
            SIGSTRCASE(SIGXCPU)
            SIGSTRCASE(SIGXFSZ)
            SIGSTRCASE(SIGSYS)
        default:
            return fmt::format("<unknown ({})>", signal_num_);
        }
    }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};
#undef SIGSTRCASE

} // namespace gradebox::linux
