#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/submission.hpp>
#include <gradebox/subprocess/child_process.hpp>
#include <gradebox/subprocess/output_capture.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace gradebox {

/// Runs one submission as a supervised child process under its policy's deadline.
///
/// States: Pending -> Spawning -> Running -> {Completed, TimedOut}, with SpawnFailed reachable from
/// Spawning and SupervisionFailed from Running. Single use; `run` may be called once.
///
/// Whatever the terminal state, by the time `run` returns the child's whole process group has been
/// killed, the child reaped, every descriptor closed and the scratch directory removed.
class ExecutionSupervisor
{
public:
    using StateObserver = std::function<void(SupervisorState)>;

    /// The interpreter is started with these flags, then the script name.
    /// -I: ignore PYTHON* variables and user site-packages; -B: no .pyc files; -u: unbuffered output
    static constexpr std::array<std::string_view, 3> INTERPRETER_FLAGS = {"-I", "-B", "-u"};
    static constexpr std::string_view SCRIPT_NAME = "submission.py";

    /// `request` must have passed the policy check and must outlive this object
    ExecutionSupervisor(const ExecutionRequest& request, EnvironmentMap environment);

    /// Called on every state transition, on the supervising thread
    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

    SupervisorState state() const { return state_; }

    /// Spawn, supervise and tear down the child. Blocks until a terminal state is reached.
    /// `cancel`, if given, must outlive the call.
    RawCapture run(const CancellationToken* cancel = nullptr);

    /// How a finished run is reported to the grading caller. Death by SIGXCPU counts as a timeout.
    static Outcome classify(const RawCapture& raw);

    /// RLIMIT_CPU for the child. It only catches a supervisor that fails to enforce the deadline.
    /// CPU time accumulates over every thread, so a run that stays within `max_seconds` of wall-clock
    /// time on `num_cpus` cores never reaches it.
    static int cpu_limit_seconds(int max_seconds, unsigned int num_cpus);

private:
    void transition(SupervisorState next);

    RawCapture fail_spawn(std::string message);

    /// The poll loop. Returns once the child's exit is observed or the deadline (or a
    /// cancellation) wins; the child is still unreaped at that point.
    Expected<void, std::string> wait_for_exit_or_deadline(ChildProcess& child, const CancellationToken* cancel,
                                                          RawCapture& raw);

    /// Kill what remains of the process group, reap the child, then collect the output still in
    /// flight.
    Expected<void, std::string> tear_down(ChildProcess& child, RawCapture& raw);

    /// Read from every still-open output pipe until EOF or until `grace` runs out
    void drain_remaining(ChildProcess& child, std::chrono::milliseconds grace);

    /// Push as much canned stdin as the child will take right now
    void feed_stdin(ChildProcess& child);

    Expected<void, std::string> read_into(ChildProcess& child, OutputCapture& capture, bool is_stdout);

    const ExecutionRequest& request_;
    EnvironmentMap environment_;
    SupervisorState state_ = SupervisorState::Pending;
    StateObserver observer_;

    OutputCapture stdout_capture_;
    OutputCapture stderr_capture_;
    std::string_view pending_stdin_;
};

} // namespace gradebox
