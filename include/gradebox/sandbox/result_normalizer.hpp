#pragma once

#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace gradebox {

/// How many raw bytes of one stream the supervisor keeps for a given output cap. The rest is
/// drained and discarded. Leaves room for line-ending and escape-sequence normalization to
/// shrink the text without it dropping under the cap.
constexpr std::size_t capture_limit(std::size_t max_output_bytes) {
    return 2 * max_output_bytes + 64;
}

/// "\r\n" and lone "\r" become "\n"
std::string normalize_line_endings(std::string_view text);

/// Remove ECMA-48 escape sequences: two-byte `ESC Fe` sequences and complete CSI sequences
/// (`ESC [ params intermediates final`). An ESC that starts neither is kept.
std::string strip_ansi_escapes(std::string_view text);

/// Normalize one captured stream and clip it to `policy.max_output_bytes` without splitting a
/// UTF-8 sequence. `overflowed` says bytes were already dropped during capture.
CapturedStream normalize_stream(std::string_view raw, bool overflowed, const ExecutionPolicy& policy);

/// Package what the supervisor captured, classified as `outcome`, into the final result
ExecutionResult normalize(const RawCapture& raw, Outcome outcome, const ExecutionPolicy& policy);

} // namespace gradebox
