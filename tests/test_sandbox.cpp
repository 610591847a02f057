#include "catch2_custom.hpp"

#include <gradebox/common/linux.hpp>
#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/sandbox.hpp>
#include <gradebox/sandbox/submission.hpp>
#include <gradebox/sandbox/supervisor.hpp>
#include <gradebox/subprocess/exit_status.hpp>
#include <gradebox/subprocess/scratch_dir.hpp>

#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <sys/types.h>

using namespace gradebox;
using namespace std::chrono_literals;

namespace {

ExecutionPolicy test_policy() {
    ExecutionPolicy policy;
    policy.interpreter = GRADEBOX_TEST_PYTHON;
    return policy;
}

ExecutionRequest make_request(std::string source, ExecutionPolicy policy = test_policy()) {
    return ExecutionRequest{.source = SubmissionSource{std::move(source), "hw1", "student"},
                            .policy = std::move(policy)};
}

ExecutionResult run_source(std::string source, ExecutionPolicy policy = test_policy()) {
    return Sandbox::run(make_request(std::move(source), std::move(policy)));
}

pid_t first_line_as_pid(const std::string& text) {
    const auto newline = text.find('\n');
    REQUIRE(newline != std::string::npos);

    const pid_t pid = std::stoi(text.substr(0, newline));
    REQUIRE(pid > 0);
    return pid;
}

/// Whether `pid` has exited. A killed process may linger briefly as a zombie until whoever
/// inherited it reaps it, which counts as gone.
bool process_is_gone(pid_t pid) {
    for (int attempt = 0; attempt < 200; ++attempt) {
        auto res = linux::kill(pid, 0);
        if (!res && res.error() == std::errc::no_such_process) {
            return true;
        }

        // The state follows the parenthesized command name in /proc/<pid>/stat
        std::ifstream stat_file{fmt::format("/proc/{}/stat", pid)};
        std::string stat{std::istreambuf_iterator<char>{stat_file}, {}};
        const auto state_pos = stat.rfind(')');
        if (state_pos != std::string::npos && state_pos + 2 < stat.size() && stat[state_pos + 2] == 'Z') {
            return true;
        }

        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

TEST_CASE("A well-behaved submission succeeds") {
    auto result = run_source("import math\nprint(math.sqrt(16))\n");

    REQUIRE(result.outcome() == Outcome::Success);
    REQUIRE(result.succeeded());
    REQUIRE(result.stdout_stream() == CapturedStream{.text = "4.0\n", .truncated = false});
    REQUIRE(result.stderr_stream().text.empty());
    REQUIRE(result.exit_code() == 0);
    REQUIRE(result.diagnostics().empty());
    REQUIRE(!result.cancelled());
    REQUIRE(result.elapsed().count() > 0);
}

TEST_CASE("An uncaught exception is a runtime error") {
    auto result = run_source("print('before')\nraise ValueError('boom')\n");

    REQUIRE(result.outcome() == Outcome::RuntimeError);
    REQUIRE(result.exit_code() == 1);
    REQUIRE(result.stdout_stream().text == "before\n");
    REQUIRE_THAT(result.stderr_stream().text, Catch::Matchers::ContainsSubstring("ValueError: boom"));
}

TEST_CASE("A non-zero exit is a runtime error") {
    auto result = run_source("raise SystemExit(3)\n");

    REQUIRE(result.outcome() == Outcome::RuntimeError);
    REQUIRE(result.exit_code() == 3);
}

TEST_CASE("Death by signal is a runtime error") {
    auto policy = test_policy();
    policy.allowed_imports = {"os", "signal"};

    auto result = run_source("import os, signal\nos.kill(os.getpid(), signal.SIGTERM)\n", policy);

    REQUIRE(result.outcome() == Outcome::RuntimeError);
    REQUIRE(result.term_signal() == SIGTERM);
    REQUIRE(!result.exit_code());
}

TEST_CASE("A disallowed import is rejected without running anything") {
    auto marker_dir = ScratchDir::create("gradebox-marker-");
    REQUIRE(marker_dir);
    const std::string marker = marker_dir->path() + "/ran";

    auto result = run_source("open('" + marker + "', 'w').write('x')\nimport os\n");

    REQUIRE(result.outcome() == Outcome::PolicyViolation);
    REQUIRE(result.diagnostics() == std::vector<std::string>{"line 2: import of 'os' is not allowed"});
    REQUIRE(!result.exit_status());
    REQUIRE(result.stdout_stream().text.empty());
    REQUIRE(!std::filesystem::exists(marker));
}

TEST_CASE("Unparseable submissions are policy violations") {
    auto result = run_source("def broken(:\n");

    REQUIRE(result.outcome() == Outcome::PolicyViolation);
    REQUIRE(result.diagnostics().size() == 1);
}

TEST_CASE("An infinite loop times out") {
    auto policy = test_policy();
    policy.max_seconds = 1;

    const auto start = std::chrono::steady_clock::now();
    auto result = run_source("print('spinning', flush=True)\nwhile True:\n    pass\n", policy);
    const auto wall = std::chrono::steady_clock::now() - start;

    REQUIRE(result.outcome() == Outcome::Timeout);
    REQUIRE(!result.cancelled());
    REQUIRE(result.term_signal() == SIGKILL);

    // Output produced before the deadline is kept
    REQUIRE(result.stdout_stream().text == "spinning\n");

    REQUIRE(result.elapsed().count() >= std::chrono::microseconds{1s}.count());
    REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(wall).count() < 3000);
}

TEST_CASE("A sleeping submission times out too") {
    auto policy = test_policy();
    policy.max_seconds = 1;
    policy.allowed_imports = {"time"};

    auto result = run_source("import time\ntime.sleep(60)\n", policy);

    REQUIRE(result.outcome() == Outcome::Timeout);
    REQUIRE(result.elapsed().count() < std::chrono::microseconds{3s}.count());
}

TEST_CASE("Output is truncated to exactly the cap") {
    auto policy = test_policy();
    policy.max_output_bytes = 2000;

    auto result = run_source("print('x' * 5000, end='')\n", policy);

    REQUIRE(result.outcome() == Outcome::Success);
    REQUIRE(result.stdout_stream().truncated);
    REQUIRE(result.stdout_stream().text == std::string(2000, 'x'));
}

TEST_CASE("A flood of output is drained and does not stall the child") {
    auto policy = test_policy();
    policy.max_output_bytes = 100;
    policy.allowed_imports.emplace_back("sys");

    auto result =
        run_source("import sys\nfor _ in range(2000):\n    sys.stderr.write('e' * 1000)\nprint('done')\n", policy);

    REQUIRE(result.outcome() == Outcome::Success);
    REQUIRE(result.stdout_stream().text == "done\n");
    REQUIRE(result.stderr_stream().truncated);
    REQUIRE(result.stderr_stream().text.size() == 100);
}

TEST_CASE("Line endings in output are normalized") {
    auto result = run_source("print('a\\r\\nb\\rc')\n");

    REQUIRE(result.stdout_stream().text == "a\nb\nc\n");
}

TEST_CASE("Nothing from this process's environment reaches the submission") {
    REQUIRE(::setenv("GRADEBOX_TEST_SECRET", "hunter2", 1) == 0);

    auto policy = test_policy();
    policy.allowed_imports = {"os"};
    policy.extra_environment = {{"MPLBACKEND", "Agg"}};

    auto result = run_source("import os\n"
                             "print(os.environ.get('GRADEBOX_TEST_SECRET'))\n"
                             "print(os.environ['HOME'], os.environ['MPLBACKEND'])\n",
                             policy);

    REQUIRE(::unsetenv("GRADEBOX_TEST_SECRET") == 0);

    REQUIRE(result.outcome() == Outcome::Success);
    REQUIRE(result.stdout_stream().text == "None\n/nonexistent Agg\n");
}

TEST_CASE("Canned stdin is delivered and then closed") {
    auto policy = test_policy();
    policy.stdin_data = "3\n4\n";

    auto result = run_source("a = int(input())\nb = int(input())\nprint(a + b)\n", policy);
    REQUIRE(result.stdout_stream().text == "7\n");

    // Reading past the end raises instead of hanging
    auto past_end = run_source("input()\ninput()\ninput()\n", policy);
    REQUIRE(past_end.outcome() == Outcome::RuntimeError);
    REQUIRE_THAT(past_end.stderr_stream().text, Catch::Matchers::ContainsSubstring("EOFError"));
}

TEST_CASE("Without canned stdin, reading input fails immediately") {
    auto result = run_source("input()\n");

    REQUIRE(result.outcome() == Outcome::RuntimeError);
    REQUIRE_THAT(result.stderr_stream().text, Catch::Matchers::ContainsSubstring("EOFError"));
}

TEST_CASE("The submission runs from its own scratch directory") {
    auto result = run_source("print(open('submission.py').readline(), end='')\n");

    REQUIRE(result.stdout_stream().text == "print(open('submission.py').readline(), end='')\n");
}

TEST_CASE("Background descendants are killed with the submission") {
    auto policy = test_policy();
    policy.allowed_imports = {"subprocess"};

    constexpr std::string_view spawn_grandchild = "import subprocess\n"
                                                  "p = subprocess.Popen(['sleep', '30'])\n"
                                                  "print(p.pid)\n";

    SECTION("After a normal exit") {
        auto result = run_source(std::string{spawn_grandchild}, policy);

        REQUIRE(result.outcome() == Outcome::Success);
        REQUIRE(process_is_gone(first_line_as_pid(result.stdout_stream().text)));
    }

    SECTION("After a timeout") {
        policy.max_seconds = 1;
        auto result = run_source(std::string{spawn_grandchild} + "while True:\n    pass\n", policy);

        REQUIRE(result.outcome() == Outcome::Timeout);
        REQUIRE(process_is_gone(first_line_as_pid(result.stdout_stream().text)));
    }
}

TEST_CASE("Running the same request twice gives the same result") {
    const auto request = make_request("print(sum(range(10)))\n");

    auto first = Sandbox::run(request);
    auto second = Sandbox::run(request);

    REQUIRE(first.outcome() == second.outcome());
    REQUIRE(first.stdout_stream() == second.stdout_stream());
    REQUIRE(first.exit_status() == second.exit_status());
}

TEST_CASE("A missing interpreter is an internal error") {
    auto policy = test_policy();
    policy.interpreter = "/nonexistent/python3";

    auto result = run_source("print('hi')\n", policy);

    REQUIRE(result.outcome() == Outcome::InternalError);
    REQUIRE(!result.exit_status());
    REQUIRE(result.diagnostics().size() == 1);
    REQUIRE_THAT(result.diagnostics().front(), Catch::Matchers::StartsWith("could not start /nonexistent/python3"));
}

TEST_CASE("An invalid policy is a contract violation") {
    auto policy = test_policy();
    policy.max_seconds = 0;

    REQUIRE_THROWS_AS(run_source("print('hi')\n", policy), InvalidPolicyError);
    REQUIRE_THROWS_WITH(Sandbox::require_valid(policy),
                        "invalid execution policy: max_seconds must be in [1, 3600], got 0");
}

TEST_CASE("Cancelling a run ends it like a timeout") {
    auto policy = test_policy();
    policy.max_seconds = 30;

    const auto request = make_request("while True:\n    pass\n", policy);

    CancellationToken token;
    std::jthread canceller{[&token] {
        std::this_thread::sleep_for(300ms);
        token.cancel();
    }};

    auto result = Sandbox::run(request, &token);

    REQUIRE(result.outcome() == Outcome::Timeout);
    REQUIRE(result.cancelled());
    REQUIRE(result.elapsed().count() < std::chrono::microseconds{5s}.count());
}

TEST_CASE("A token cancelled up front stops the run at once") {
    CancellationToken token;
    token.cancel();
    token.cancel();
    REQUIRE(token.is_cancelled());

    auto result = Sandbox::run(make_request("print('hi')\n"), &token);

    REQUIRE(result.outcome() == Outcome::Timeout);
    REQUIRE(result.cancelled());
}

TEST_CASE("Supervisor state transitions") {
    std::vector<SupervisorState> seen;

    SECTION("Normal completion") {
        const auto request = make_request("print('ok')\n");
        ExecutionSupervisor supervisor{request, build_environment(request.policy)};
        supervisor.set_state_observer([&](SupervisorState state) { seen.push_back(state); });

        REQUIRE(supervisor.state() == SupervisorState::Pending);

        auto raw = supervisor.run();

        REQUIRE(seen ==
                std::vector{SupervisorState::Spawning, SupervisorState::Running, SupervisorState::Completed});
        REQUIRE(raw.final_state == SupervisorState::Completed);
        REQUIRE(raw.stdout_data == "ok\n");
        REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::Success);
    }

    SECTION("Spawn failure") {
        auto policy = test_policy();
        policy.interpreter = "/nonexistent/python3";
        const auto request = make_request("print('ok')\n", policy);

        ExecutionSupervisor supervisor{request, build_environment(request.policy)};
        supervisor.set_state_observer([&](SupervisorState state) { seen.push_back(state); });

        auto raw = supervisor.run();

        REQUIRE(seen == std::vector{SupervisorState::Spawning, SupervisorState::SpawnFailed});
        REQUIRE(!raw.internal_error.empty());
        REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::InternalError);
    }

    SECTION("Timeout") {
        auto policy = test_policy();
        policy.max_seconds = 1;
        const auto request = make_request("while True:\n    pass\n", policy);

        ExecutionSupervisor supervisor{request, build_environment(request.policy)};
        supervisor.set_state_observer([&](SupervisorState state) { seen.push_back(state); });

        auto raw = supervisor.run();

        REQUIRE(seen == std::vector{SupervisorState::Spawning, SupervisorState::Running, SupervisorState::TimedOut});
        REQUIRE(raw.exit_status == ExitStatus::make_signaled(SIGKILL));
        REQUIRE(is_terminal(supervisor.state()));
    }
}

TEST_CASE("The CPU-time backstop scales with the number of cores") {
    REQUIRE(ExecutionSupervisor::cpu_limit_seconds(10, 1) == 11);
    REQUIRE(ExecutionSupervisor::cpu_limit_seconds(10, 8) == 81);

    // An unknown core count is treated as one core
    REQUIRE(ExecutionSupervisor::cpu_limit_seconds(10, 0) == 11);
}

TEST_CASE("Classifying raw captures") {
    RawCapture raw;

    raw.final_state = SupervisorState::Completed;
    raw.exit_status = ExitStatus::make_exited(0);
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::Success);

    raw.exit_status = ExitStatus::make_exited(2);
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::RuntimeError);

    raw.exit_status = ExitStatus::make_signaled(SIGSEGV);
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::RuntimeError);

    // Only the CPU-time backstop sends SIGXCPU
    raw.exit_status = ExitStatus::make_signaled(SIGXCPU);
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::Timeout);

    raw.final_state = SupervisorState::TimedOut;
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::Timeout);

    raw.final_state = SupervisorState::SupervisionFailed;
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::InternalError);

    raw.final_state = SupervisorState::SpawnFailed;
    REQUIRE(ExecutionSupervisor::classify(raw) == Outcome::InternalError);
}
