#pragma once

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/sandbox/submission.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

struct ProgramOptions
{

    // ###### Argument fields

    /// run = check, then execute each file and report how it behaved
    /// check = only run the static import check; nothing is executed
    enum class Command { Run, Check } command = Command::Run;

    /// Level of verbosity for cli output. See \ref VerbosityLevel.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Python source files, one submission each
    std::vector<std::string> files;

    /// Label for the reports and logs; the student id of each submission is its file stem
    std::string assignment_name = std::string{DEFAULT_ASSIGNMENT_NAME};

    int timeout_seconds = ExecutionPolicy::DEFAULT_MAX_SECONDS;

    /// Replaces the default allow-list when non-empty
    std::vector<std::string> allowed_imports;

    std::size_t max_output_bytes = ExecutionPolicy::DEFAULT_MAX_OUTPUT_BYTES;

    std::string interpreter = std::string{ExecutionPolicy::DEFAULT_INTERPRETER};

    /// File whose contents become the standard input of every run
    std::optional<std::string> stdin_file;

    /// Raw `KEY=VALUE` strings, as given on the command line
    std::vector<std::string> env_assignments;

    bool strip_ansi = false;

    /// Number of submissions run at once. 0 = one per hardware thread.
    std::size_t jobs = DEFAULT_JOBS;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_ASSIGNMENT_NAME = "cli";
    static constexpr std::size_t DEFAULT_JOBS = 1;
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    /// Read a whole file into memory
    static Expected<std::string> read_file(const std::filesystem::path& path);

    /// e.g. `Could not read "a.py": Permission denied`
    static std::string describe_read_error(const std::filesystem::path& path, const std::error_code& err);

    /// Split `KEY=VALUE` at the first '='
    static Expected<std::pair<std::string, std::string>, std::string> parse_env_assignment(std::string_view text);

    /// The ExecutionPolicy these options describe. Reads `stdin_file`, if given.
    Expected<ExecutionPolicy, std::string> make_policy() const;

    /// Verify that all fields are valid, including the policy they build
    Expected<void, std::string> validate();
};

constexpr std::string_view format_as(ProgramOptions::Command command) {
    switch (command) {
    case ProgramOptions::Command::Run:
        return "run";
    case ProgramOptions::Command::Check:
        return "check";
    default:
        return "<unknown>";
    }
}

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{command={}, verbosity={}, color_opt={}, files={}, assignment={:?}, timeout={}, "
                              "allowed_imports={}, max_output={}, interpreter={:?}, stdin_file={}, env={}, "
                              "strip_ansi={}, jobs={}}}",
                              from.command, fmt::underlying(from.verbosity), fmt::underlying(from.colorize_option),
                              from.files, from.assignment_name, from.timeout_seconds, from.allowed_imports,
                              from.max_output_bytes, from.interpreter, from.stdin_file, from.env_assignments,
                              from.strip_ansi, from.jobs);
    }
};
