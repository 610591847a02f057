#pragma once

#include <gradebox/subprocess/exit_status.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

/// How an execution attempt concluded. Exactly one applies to every result.
enum class Outcome {
    Success,         ///< Ran to completion with exit status 0
    RuntimeError,    ///< Ran and exited non-zero or was killed by a signal
    Timeout,         ///< Exceeded the wall-clock budget (or was cancelled)
    PolicyViolation, ///< Rejected before execution; nothing was spawned
    InternalError    ///< The sandbox itself could not create or manage the process
};

constexpr std::string_view format_as(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return "Success";
    case Outcome::RuntimeError:
        return "RuntimeError";
    case Outcome::Timeout:
        return "Timeout";
    case Outcome::PolicyViolation:
        return "PolicyViolation";
    case Outcome::InternalError:
        return "InternalError";
    default:
        return "<unknown>";
    }
}

/// States of the execution supervisor. `Completed`, `TimedOut`, `SpawnFailed` and
/// `SupervisionFailed` are terminal.
enum class SupervisorState { Pending, Spawning, Running, Completed, TimedOut, SpawnFailed, SupervisionFailed };

constexpr std::string_view format_as(SupervisorState state) {
    switch (state) {
    case SupervisorState::Pending:
        return "Pending";
    case SupervisorState::Spawning:
        return "Spawning";
    case SupervisorState::Running:
        return "Running";
    case SupervisorState::Completed:
        return "Completed";
    case SupervisorState::TimedOut:
        return "TimedOut";
    case SupervisorState::SpawnFailed:
        return "SpawnFailed";
    case SupervisorState::SupervisionFailed:
        return "SupervisionFailed";
    default:
        return "<unknown>";
    }
}

constexpr bool is_terminal(SupervisorState state) {
    using enum SupervisorState;
    return state == Completed || state == TimedOut || state == SpawnFailed || state == SupervisionFailed;
}

/// Everything the supervisor observed about one run, before normalization
struct RawCapture
{
    SupervisorState final_state = SupervisorState::Pending;

    std::string stdout_data;
    bool stdout_overflowed = false; ///< bytes were drained but not retained
    std::string stderr_data;
    bool stderr_overflowed = false;

    /// Only present if the child was reaped
    std::optional<ExitStatus> exit_status;

    /// From the moment the child was confirmed running until its exit (or kill) was observed
    std::chrono::microseconds elapsed{};

    bool cancelled = false;

    /// Human-readable explanation for SpawnFailed / SupervisionFailed
    std::string internal_error;
};

/// One captured output stream after normalization
struct CapturedStream
{
    std::string text;
    bool truncated = false;

    bool operator==(const CapturedStream&) const = default;
};

/// Final, immutable description of one execution request, owned by the grading caller
class ExecutionResult
{
public:
    ExecutionResult(Outcome outcome, CapturedStream stdout_stream, CapturedStream stderr_stream,
                    std::optional<ExitStatus> exit_status, std::chrono::microseconds elapsed,
                    std::vector<std::string> diagnostics, bool cancelled)
        : outcome_{outcome}
        , stdout_{std::move(stdout_stream)}
        , stderr_{std::move(stderr_stream)}
        , exit_status_{exit_status}
        , elapsed_{elapsed}
        , diagnostics_{std::move(diagnostics)}
        , cancelled_{cancelled} {}

    /// A result for a submission rejected before anything was spawned
    static ExecutionResult make_policy_violation(std::vector<std::string> reasons) {
        return {Outcome::PolicyViolation, {}, {}, std::nullopt, {}, std::move(reasons), false};
    }

    Outcome outcome() const { return outcome_; }

    const CapturedStream& stdout_stream() const { return stdout_; }
    const CapturedStream& stderr_stream() const { return stderr_; }

    /// Exit code, if and only if the process terminated on its own via exit
    std::optional<int> exit_code() const {
        if (exit_status_ && exit_status_->get_kind() == ExitStatus::Kind::Exited) {
            return exit_status_->get_code();
        }
        return std::nullopt;
    }

    /// Terminating signal, if the process was killed by one
    std::optional<int> term_signal() const {
        if (exit_status_ && exit_status_->get_kind() == ExitStatus::Kind::Signaled) {
            return exit_status_->get_code();
        }
        return std::nullopt;
    }

    const std::optional<ExitStatus>& exit_status() const { return exit_status_; }

    std::chrono::microseconds elapsed() const { return elapsed_; }

    /// Policy violation reasons, or the internal error description. Empty otherwise.
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

    /// Whether the run was ended by a CancellationToken rather than by the deadline
    bool cancelled() const { return cancelled_; }

    bool succeeded() const { return outcome_ == Outcome::Success; }

private:
    Outcome outcome_;
    CapturedStream stdout_;
    CapturedStream stderr_;
    std::optional<ExitStatus> exit_status_;
    std::chrono::microseconds elapsed_;
    std::vector<std::string> diagnostics_;
    bool cancelled_;
};

} // namespace gradebox
