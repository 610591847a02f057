#pragma once

#include <gradebox/common/linux.hpp>

#include <fmt/format.h>

#include <string>

#include <sys/wait.h>

namespace gradebox {

/// How a reaped child process terminated
class ExitStatus
{
public:
    enum class Kind { Exited, Signaled };

    static ExitStatus make_exited(int code);
    static ExitStatus make_signaled(int signal_num, bool core_dumped = false);

    /// Build from the siginfo_t that waitid(2) filled in for a terminated child
    static ExitStatus from_siginfo(const siginfo_t& info);

    Kind get_kind() const { return kind_; }

    /// Exit code if `Exited`, signal number if `Signaled`
    int get_code() const { return code_; }

    bool core_dumped() const { return core_dumped_; }

    bool exited_normally() const { return kind_ == Kind::Exited && code_ == 0; }

    friend std::string format_as(const ExitStatus& from) {
        if (from.kind_ == Kind::Exited) {
            return fmt::format("exited with code {}", from.code_);
        }
        return fmt::format("killed by {}{}", linux::Signal{from.code_}, from.core_dumped_ ? " (core dumped)" : "");
    }

    bool operator==(const ExitStatus&) const = default;

private:
    ExitStatus(Kind kind, int code, bool core_dumped);

    Kind kind_;
    int code_;
    bool core_dumped_;
};

} // namespace gradebox
