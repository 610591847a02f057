#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/result_normalizer.hpp>
#include <gradebox/sandbox/supervisor.hpp>
#include <gradebox/subprocess/child_process.hpp>
#include <gradebox/subprocess/output_capture.hpp>
#include <gradebox/subprocess/scratch_dir.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <csignal>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

namespace gradebox {

namespace {

using std::chrono::steady_clock;

/// After the group is killed, how long to keep reading output that was already in the pipes
constexpr std::chrono::milliseconds DRAIN_GRACE{100};

/// Poll interval for a CancellationToken that has no eventfd
constexpr int CANCEL_CHECK_INTERVAL_MS = 50;

int remaining_ms(steady_clock::time_point deadline) {
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - steady_clock::now());
    return gsl::narrow_cast<int>(std::max<std::chrono::milliseconds::rep>(remaining.count(), 0));
}

constexpr bool has_input(short revents) {
    return (revents & (POLLIN | POLLHUP | POLLERR)) != 0; // NOLINT(*-signed-bitwise)
}

} // namespace

ExecutionSupervisor::ExecutionSupervisor(const ExecutionRequest& request, EnvironmentMap environment)
    : request_{request}
    , environment_{std::move(environment)}
    , stdout_capture_{capture_limit(request.policy.max_output_bytes)}
    , stderr_capture_{capture_limit(request.policy.max_output_bytes)}
    , pending_stdin_{request.policy.stdin_data} {}

void ExecutionSupervisor::transition(SupervisorState next) {
    LOG_TRACE("Supervisor state {} -> {}", state_, next);

    state_ = next;
    if (observer_) {
        observer_(next);
    }
}

RawCapture ExecutionSupervisor::fail_spawn(std::string message) {
    LOG_WARN("Could not start submission from {:?}: {}", request_.source.student_id(), message);

    transition(SupervisorState::SpawnFailed);

    RawCapture raw;
    raw.final_state = state_;
    raw.internal_error = std::move(message);
    return raw;
}

RawCapture ExecutionSupervisor::run(const CancellationToken* cancel) {
    ASSERT(state_ == SupervisorState::Pending, "ExecutionSupervisor::run may only be called once", state_);

    const ExecutionPolicy& policy = request_.policy;

    transition(SupervisorState::Spawning);

    // Declared before the child, so that the child is always gone before its directory is removed
    auto scratch = ScratchDir::create();
    if (!scratch) {
        return fail_spawn(fmt::format("could not create a scratch directory: {}", scratch.error().message()));
    }

    if (auto script = scratch->write_file(SCRIPT_NAME, request_.source.text()); !script) {
        return fail_spawn(fmt::format("could not write {}: {}", SCRIPT_NAME, script.error().message()));
    }

    SpawnOptions opts{.executable = policy.interpreter,
                      .args = {INTERPRETER_FLAGS.begin(), INTERPRETER_FLAGS.end()},
                      .env = to_env_strings(environment_),
                      .working_dir = scratch->path(),
                      .stdin_data = std::nullopt,
                      .cpu_limit_seconds = cpu_limit_seconds(policy.max_seconds, std::thread::hardware_concurrency())};
    opts.args.emplace_back(SCRIPT_NAME);
    if (!policy.stdin_data.empty()) {
        opts.stdin_data = policy.stdin_data;
    }

    auto child = ChildProcess::spawn(opts);
    if (!child) {
        return fail_spawn(fmt::format("could not start {}: {}", policy.interpreter, child.error()));
    }

    transition(SupervisorState::Running);

    RawCapture raw;

    auto res = wait_for_exit_or_deadline(*child, cancel, raw);
    if (res) {
        res = tear_down(*child, raw);
    }

    if (!res) {
        LOG_ERROR("Lost control of child {} for {:?}: {}", child->pid(), request_.source.student_id(), res.error());

        raw.internal_error = res.error();
        transition(SupervisorState::SupervisionFailed);
    }

    raw.final_state = state_;
    raw.stdout_overflowed = stdout_capture_.overflowed();
    raw.stdout_data = stdout_capture_.take();
    raw.stderr_overflowed = stderr_capture_.overflowed();
    raw.stderr_data = stderr_capture_.take();

    LOG_DEBUG("Submission from {:?} finished as {} after {}", request_.source.student_id(), state_,
              std::chrono::duration_cast<std::chrono::milliseconds>(raw.elapsed));

    return raw;
}

Expected<void, std::string> ExecutionSupervisor::wait_for_exit_or_deadline(ChildProcess& child,
                                                                          const CancellationToken* cancel,
                                                                          RawCapture& raw) {
    const auto deadline = child.start_time() + request_.policy.timeout();
    const bool cancel_has_fd = cancel != nullptr && cancel->fd() != -1;

    std::vector<pollfd> fds;

    while (true) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            raw.cancelled = true;
            raw.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() -
                                                                                child.start_time());
            transition(SupervisorState::TimedOut);
            return {};
        }

        if (steady_clock::now() >= deadline) {
            raw.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() -
                                                                                child.start_time());
            LOG_DEBUG("Child {} hit its {} deadline", child.pid(), request_.policy.timeout());
            transition(SupervisorState::TimedOut);
            return {};
        }

        fds.clear();
        fds.push_back({.fd = child.pidfd(), .events = POLLIN, .revents = 0});
        fds.push_back({.fd = child.stdout_fd(), .events = POLLIN, .revents = 0});
        fds.push_back({.fd = child.stderr_fd(), .events = POLLIN, .revents = 0});
        fds.push_back({.fd = child.stdin_fd(), .events = POLLOUT, .revents = 0});
        // poll(2) ignores negative descriptors, which keeps the indices fixed
        fds.push_back({.fd = cancel_has_fd ? cancel->fd() : -1, .events = POLLIN, .revents = 0});

        int timeout_ms = remaining_ms(deadline);
        if (cancel != nullptr && !cancel_has_fd) {
            timeout_ms = std::min(timeout_ms, CANCEL_CHECK_INTERVAL_MS);
        }

        auto ready = linux::poll(fds, timeout_ms);
        if (!ready) {
            if (ready.error() == std::errc::interrupted) {
                continue;
            }
            return fmt::format("poll failed: {}", ready.error().message());
        }

        if (has_input(fds[1].revents)) {
            if (auto res = read_into(child, stdout_capture_, true); !res) {
                return res;
            }
        }
        if (has_input(fds[2].revents)) {
            if (auto res = read_into(child, stderr_capture_, false); !res) {
                return res;
            }
        }
        if (fds[3].revents != 0) {
            feed_stdin(child);
        }

        // An exit that poll reported wins, even if the deadline has passed by now
        if ((fds[0].revents & POLLIN) != 0) { // NOLINT(*-signed-bitwise)
            raw.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() -
                                                                                child.start_time());
            transition(SupervisorState::Completed);
            return {};
        }
    }
}

Expected<void, std::string> ExecutionSupervisor::tear_down(ChildProcess& child, RawCapture& raw) {
    // Even after a normal exit, descendants may still be running in the group.
    // The unreaped child keeps the group id reserved, so this can't hit an unrelated group.
    if (auto res = child.kill_group(SIGKILL); !res) {
        return fmt::format("killpg({}) failed: {}", child.pid(), res.error().message());
    }

    auto status = child.reap();
    if (!status) {
        return fmt::format("waitid({}) failed: {}", child.pid(), status.error().message());
    }
    raw.exit_status = *status;

    child.close_stdin();
    drain_remaining(child, DRAIN_GRACE);

    return {};
}

void ExecutionSupervisor::drain_remaining(ChildProcess& child, std::chrono::milliseconds grace) {
    const auto deadline = steady_clock::now() + grace;

    std::vector<pollfd> fds;

    while (child.stdout_fd() != -1 || child.stderr_fd() != -1) {
        int timeout_ms = remaining_ms(deadline);

        fds.clear();
        fds.push_back({.fd = child.stdout_fd(), .events = POLLIN, .revents = 0});
        fds.push_back({.fd = child.stderr_fd(), .events = POLLIN, .revents = 0});

        auto ready = linux::poll(fds, timeout_ms);
        if (!ready) {
            if (ready.error() == std::errc::interrupted) {
                continue;
            }
            LOG_WARN("poll failed while draining output: '{}'", ready.error().message());
            break;
        }

        if (*ready == 0) {
            // Something outside the process group still holds a pipe open
            LOG_WARN("Output of child {} still open {} after it was killed; giving up on the rest", child.pid(),
                     grace);
            break;
        }

        // Read errors here only lose output that is already beyond recovery
        if (has_input(fds[0].revents)) {
            if (auto res = read_into(child, stdout_capture_, true); !res) {
                LOG_WARN("{}", res.error());
                child.close_stdout();
            }
        }
        if (has_input(fds[1].revents)) {
            if (auto res = read_into(child, stderr_capture_, false); !res) {
                LOG_WARN("{}", res.error());
                child.close_stderr();
            }
        }
    }

    child.close_stdout();
    child.close_stderr();
}

Expected<void, std::string> ExecutionSupervisor::read_into(ChildProcess& child, OutputCapture& capture,
                                                           bool is_stdout) {
    const int fd = is_stdout ? child.stdout_fd() : child.stderr_fd();

    auto eof = capture.read_available(fd);
    if (!eof) {
        return fmt::format("reading {} of child {} failed: {}", is_stdout ? "stdout" : "stderr", child.pid(),
                           eof.error().message());
    }

    if (*eof) {
        LOG_TRACE("EOF on {} of child {} ({} bytes total)", is_stdout ? "stdout" : "stderr", child.pid(),
                  capture.total_bytes());
        if (is_stdout) {
            child.close_stdout();
        } else {
            child.close_stderr();
        }
    }

    return {};
}

void ExecutionSupervisor::feed_stdin(ChildProcess& child) {
    while (!pending_stdin_.empty()) {
        auto sent = linux::send(child.stdin_fd(), pending_stdin_, MSG_NOSIGNAL | MSG_DONTWAIT); // NOLINT

        if (!sent) {
            if (linux::is_would_block(sent.error())) {
                return;
            }
            if (sent.error() == std::errc::interrupted) {
                continue;
            }

            // Typically EPIPE: the child closed its stdin or exited. It simply doesn't get the rest.
            LOG_DEBUG("Child {} stopped accepting stdin with {} bytes left: '{}'", child.pid(), pending_stdin_.size(),
                      sent.error().message());
            break;
        }

        pending_stdin_.remove_prefix(*sent);
    }

    // Closing our end gives the child EOF, so a read past the canned input can't block
    pending_stdin_ = {};
    child.close_stdin();
}

int ExecutionSupervisor::cpu_limit_seconds(int max_seconds, unsigned int num_cpus) {
    // hardware_concurrency() may report 0 when it can't tell
    const int cpus = gsl::narrow_cast<int>(std::max(num_cpus, 1U));

    return max_seconds * cpus + 1;
}

Outcome ExecutionSupervisor::classify(const RawCapture& raw) {
    switch (raw.final_state) {
    case SupervisorState::Completed:
        if (raw.exit_status && raw.exit_status->get_kind() == ExitStatus::Kind::Signaled &&
            raw.exit_status->get_code() == SIGXCPU) {
            // The CPU-time backstop fired, so the run overran its budget
            return Outcome::Timeout;
        }
        return raw.exit_status && raw.exit_status->exited_normally() ? Outcome::Success : Outcome::RuntimeError;
    case SupervisorState::TimedOut:
        return Outcome::Timeout;
    case SupervisorState::SpawnFailed:
    case SupervisorState::SupervisionFailed:
        return Outcome::InternalError;
    default:
        UNREACHABLE("classify() called on a capture that never reached a terminal state", raw.final_state);
    }
}

} // namespace gradebox
