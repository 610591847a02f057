#pragma once

#include <gradebox/common/expected.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

/// A piece of student-authored source code to be evaluated. Never mutated after creation.
class SubmissionSource
{
public:
    SubmissionSource(std::string text, std::string assignment_id, std::string student_id)
        : text_{std::move(text)}
        , assignment_id_{std::move(assignment_id)}
        , student_id_{std::move(student_id)} {}

    const std::string& text() const { return text_; }
    const std::string& assignment_id() const { return assignment_id_; }
    const std::string& student_id() const { return student_id_; }

private:
    std::string text_;
    std::string assignment_id_;
    std::string student_id_;
};

/// Thrown when a caller hands the sandbox an ExecutionPolicy that fails `validate()`.
/// This is a programming-contract violation, never a property of a submission.
class InvalidPolicyError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/// Per-assignment execution limits. Loaded once per grading session and treated as read-only.
struct ExecutionPolicy
{
    /// Wall-clock budget for a single run, measured from the moment the child is confirmed running
    int max_seconds = DEFAULT_MAX_SECONDS;

    /// Top-level module names a submission may import, in the order they were configured
    std::vector<std::string> allowed_imports = default_allowed_imports();

    /// Cap applied independently to captured stdout and stderr
    std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    /// Absolute path of the Python interpreter used to run submissions
    std::string interpreter = std::string{DEFAULT_INTERPRETER};

    /// Canned standard input. Empty means the child reads from /dev/null.
    std::string stdin_data;

    /// Remove terminal escape sequences (colors, cursor movement) from captured output
    bool strip_ansi_escapes = false;

    /// Extra variables for the child environment. Set explicitly; never inherited from this process.
    std::map<std::string, std::string> extra_environment;

    static constexpr int DEFAULT_MAX_SECONDS = 10;
    static constexpr int MAX_SECONDS_LIMIT = 60 * 60;
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = 2000;
    static constexpr std::size_t MAX_OUTPUT_BYTES_LIMIT = std::size_t{64} * 1024 * 1024;
    static constexpr std::string_view DEFAULT_INTERPRETER = "/usr/bin/python3";

    static std::vector<std::string> default_allowed_imports();

    /// Whether `top_level_module` is on the allow-list
    bool allows_import(std::string_view top_level_module) const;

    std::chrono::seconds timeout() const { return std::chrono::seconds{max_seconds}; }

    /// Verify that all fields are valid. The error names the first offending field.
    Expected<void, std::string> validate() const;
};

/// The unit of work handed to the sandbox. Not retried automatically.
struct ExecutionRequest
{
    SubmissionSource source;
    ExecutionPolicy policy;
};

} // namespace gradebox
