#include "catch2_custom.hpp"

#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/result_normalizer.hpp>
#include <gradebox/sandbox/submission.hpp>
#include <gradebox/subprocess/exit_status.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>
#include <vector>

using namespace gradebox;

namespace {

ExecutionPolicy policy_with_cap(std::size_t max_output_bytes, bool strip_ansi = false) {
    ExecutionPolicy policy;
    policy.max_output_bytes = max_output_bytes;
    policy.strip_ansi_escapes = strip_ansi;
    return policy;
}

} // namespace

TEST_CASE("Line endings are normalized") {
    REQUIRE(normalize_line_endings("a\r\nb\rc\n") == "a\nb\nc\n");
    REQUIRE(normalize_line_endings("\r\r\n") == "\n\n");
    REQUIRE(normalize_line_endings("plain") == "plain");
    REQUIRE(normalize_line_endings("") == "");
}

TEST_CASE("Escape sequences are stripped") {
    REQUIRE(strip_ansi_escapes("\x1B[31mred\x1B[0m") == "red");
    REQUIRE(strip_ansi_escapes("\x1B[1;32;40mbold\x1B[m") == "bold");
    REQUIRE(strip_ansi_escapes("\x1B[2J\x1B[Hcleared") == "cleared");
    REQUIRE(strip_ansi_escapes("a\x1B" "Mb") == "ab");

    // Incomplete sequences are left alone
    REQUIRE(strip_ansi_escapes("\x1B[31") == "\x1B[31");
    REQUIRE(strip_ansi_escapes("end\x1B") == "end\x1B");
    REQUIRE(strip_ansi_escapes("no escapes") == "no escapes");
}

TEST_CASE("Streams under the cap are kept whole") {
    auto stream = normalize_stream("4.0\n", false, ExecutionPolicy{});

    REQUIRE(stream == CapturedStream{.text = "4.0\n", .truncated = false});
}

TEST_CASE("Streams over the cap are truncated to exactly the cap") {
    const std::string raw(5000, 'x');

    auto stream = normalize_stream(raw, false, policy_with_cap(2000));

    REQUIRE(stream.truncated);
    REQUIRE(stream.text.size() == 2000);
    REQUIRE(stream.text == raw.substr(0, 2000));

    // Exactly at the cap is not truncated
    REQUIRE(!normalize_stream(std::string(2000, 'y'), false, policy_with_cap(2000)).truncated);
}

TEST_CASE("Bytes dropped during capture still mark the stream truncated") {
    auto stream = normalize_stream("short", true, policy_with_cap(2000));

    REQUIRE(stream.truncated);
    REQUIRE(stream.text == "short");
}

TEST_CASE("Truncation never splits a UTF-8 sequence") {
    // U+00E9 is two bytes; a cap of 4 would land in the middle of the second one
    auto stream = normalize_stream("a\xC3\xA9\xC3\xA9", false, policy_with_cap(4));

    REQUIRE(stream.truncated);
    REQUIRE(stream.text == "a\xC3\xA9");
}

TEST_CASE("The cap applies after normalization") {
    REQUIRE(normalize_stream("ab\r\n", false, policy_with_cap(3)) == CapturedStream{.text = "ab\n", .truncated = false});

    REQUIRE(normalize_stream("\x1B[31mok\x1B[0m", false, policy_with_cap(2)).truncated);
    REQUIRE(normalize_stream("\x1B[31mok\x1B[0m", false, policy_with_cap(2, true)) ==
            CapturedStream{.text = "ok", .truncated = false});
}

TEST_CASE("The capture limit leaves room for normalization") {
    REQUIRE(capture_limit(2000) == 4064);
    REQUIRE(capture_limit(1) > 1);
}

TEST_CASE("Normalizing a full capture") {
    RawCapture raw;
    raw.final_state = SupervisorState::Completed;
    raw.stdout_data = "out\r\n";
    raw.stderr_data = std::string(3000, 'e');
    raw.exit_status = ExitStatus::make_exited(1);
    raw.elapsed = std::chrono::milliseconds{31};

    auto result = normalize(raw, Outcome::RuntimeError, ExecutionPolicy{});

    REQUIRE(result.outcome() == Outcome::RuntimeError);
    REQUIRE(result.stdout_stream() == CapturedStream{.text = "out\n", .truncated = false});
    REQUIRE(result.stderr_stream().truncated);
    REQUIRE(result.stderr_stream().text.size() == 2000);
    REQUIRE(result.exit_code() == 1);
    REQUIRE(!result.term_signal());
    REQUIRE(result.elapsed().count() == 31000);
    REQUIRE(result.diagnostics().empty());
    REQUIRE(!result.cancelled());
    REQUIRE(!result.succeeded());
}

TEST_CASE("Internal errors carry their explanation") {
    RawCapture raw;
    raw.final_state = SupervisorState::SpawnFailed;
    raw.internal_error = "execve failed: No such file or directory";

    auto result = normalize(raw, Outcome::InternalError, ExecutionPolicy{});

    REQUIRE(result.outcome() == Outcome::InternalError);
    REQUIRE(result.diagnostics() == std::vector<std::string>{"execve failed: No such file or directory"});
    REQUIRE(!result.exit_status());
}

TEST_CASE("Signal terminations") {
    RawCapture raw;
    raw.exit_status = ExitStatus::make_signaled(SIGKILL);
    raw.cancelled = true;

    auto result = normalize(raw, Outcome::Timeout, ExecutionPolicy{});

    REQUIRE(result.term_signal() == SIGKILL);
    REQUIRE(!result.exit_code());
    REQUIRE(result.cancelled());
}

TEST_CASE("Policy violation results") {
    auto result = ExecutionResult::make_policy_violation({"line 1: import of 'os' is not allowed"});

    REQUIRE(result.outcome() == Outcome::PolicyViolation);
    REQUIRE(result.stdout_stream().text.empty());
    REQUIRE(result.stderr_stream().text.empty());
    REQUIRE(!result.exit_status());
    REQUIRE(result.elapsed().count() == 0);
    REQUIRE(result.diagnostics().size() == 1);
}
