#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/common/linux.hpp>

#include <cerrno>
#include <cstring>
#include <optional>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace gradebox::detail {

/// Steps of child setup, reported back to the parent if one fails
enum class ChildStep : int {
    SetProcessGroup,
    ParentDeathSignal,
    ResetSignals,
    ResourceLimits,
    RedirectStdio,
    ChangeDir,
    Exec
};

constexpr std::string_view child_step_name(int step) {
    switch (static_cast<ChildStep>(step)) {
    case ChildStep::SetProcessGroup:
        return "setpgid";
    case ChildStep::ParentDeathSignal:
        return "prctl(PR_SET_PDEATHSIG)";
    case ChildStep::ResetSignals:
        return "sigprocmask";
    case ChildStep::ResourceLimits:
        return "setrlimit";
    case ChildStep::RedirectStdio:
        return "dup2";
    case ChildStep::ChangeDir:
        return "chdir";
    case ChildStep::Exec:
        return "execve";
    default:
        return "child setup";
    }
}

/// Failure report written over the status pipe: which step failed, and its errno
struct StatusReport
{
    int step;
    int err;

    bool operator==(const StatusReport&) const = default;
};

/// Child side. Only async-signal-safe calls, so it may run between fork and exec.
/// A failed write leaves the parent seeing EOF, which it takes as a successful exec.
inline bool write_status_report(int status_fd, ChildStep step, int err) {
    StatusReport report{.step = static_cast<int>(step), .err = err};

    return ::write(status_fd, &report, sizeof(report)) == static_cast<ssize_t>(sizeof(report));
}

/// Parent side. Blocks until the child either reports a failure or execs (the close-on-exec
/// write end then closes, and this returns std::nullopt).
inline Expected<std::optional<StatusReport>> read_status_report(int status_fd) {
    while (true) {
        auto res = linux::read(status_fd, sizeof(StatusReport));

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return res.error();
        }

        if (res->empty()) {
            return std::optional<StatusReport>{};
        }

        // A short report still means setup failed; there's just no telling where
        StatusReport report{.step = -1, .err = EIO};
        if (res->size() == sizeof(StatusReport)) {
            std::memcpy(&report, res->data(), sizeof(StatusReport));
        }
        return std::optional{report};
    }
}

} // namespace gradebox::detail
