#pragma once

namespace gradebox {

/// How much the CLI prints. `Max` is just used as a sentinal for now.
///
///   Silent  - nothing at all; the exit code is the only report
///   Quiet   - one line per submission
///   Summary - a block per submission with outcome, timing and diagnostics, then a totals line
///   All     - additionally, the captured stdout and stderr of every run
///   Extra   - additionally, every import statement the checker found
enum class VerbosityLevel { Silent, Quiet, Summary, All, Extra, Max };

/// See \ref VerbosityLevel
constexpr bool should_output_submission_line(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level == Quiet;
}

/// See \ref VerbosityLevel
constexpr bool should_output_submission_block(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

/// See \ref VerbosityLevel
constexpr bool should_output_streams(VerbosityLevel level, bool succeeded) {
    using enum VerbosityLevel;

    // Failing runs show their streams one level earlier
    return level >= All || (level >= Summary && !succeeded);
}

/// See \ref VerbosityLevel
constexpr bool should_output_imports(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

/// See \ref VerbosityLevel
constexpr bool should_output_totals(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

} // namespace gradebox
