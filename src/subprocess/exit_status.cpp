#include <gradebox/subprocess/exit_status.hpp>

#include <libassert/assert.hpp>

#include <sys/wait.h>

namespace gradebox {

ExitStatus::ExitStatus(Kind kind, int code, bool core_dumped)
    : kind_{kind}
    , code_{code}
    , core_dumped_{core_dumped} {}

ExitStatus ExitStatus::make_exited(int code) {
    return {Kind::Exited, code, false};
}

ExitStatus ExitStatus::make_signaled(int signal_num, bool core_dumped) {
    return {Kind::Signaled, signal_num, core_dumped};
}

ExitStatus ExitStatus::from_siginfo(const siginfo_t& info) {
    // see waitid(2): for a terminated child si_code is one of CLD_EXITED, CLD_KILLED, CLD_DUMPED
    switch (info.si_code) {
    case CLD_EXITED:
        return make_exited(info.si_status);
    case CLD_KILLED:
        return make_signaled(info.si_status);
    case CLD_DUMPED:
        return make_signaled(info.si_status, true);
    default:
        UNREACHABLE("waitid reported a non-terminal child state", info.si_code);
    }
}

} // namespace gradebox
