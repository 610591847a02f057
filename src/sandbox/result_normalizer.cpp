#include <gradebox/common/utf8.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/result_normalizer.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

namespace {

constexpr char ESC = '\x1B';

constexpr bool in_range(char chr, unsigned char low, unsigned char high) {
    auto uchr = static_cast<unsigned char>(chr);
    return uchr >= low && uchr <= high;
}

/// Length of the escape sequence starting at `text[pos]` (an ESC), or 0 if it isn't one
std::size_t escape_sequence_length(std::string_view text, std::size_t pos) {
    if (pos + 1 >= text.size()) {
        return 0;
    }

    char introducer = text[pos + 1];

    // Fe sequences, except '[' which introduces CSI
    if (in_range(introducer, 0x40, 0x5A) || in_range(introducer, 0x5C, 0x5F)) {
        return 2;
    }

    if (introducer != '[') {
        return 0;
    }

    std::size_t end = pos + 2;
    while (end < text.size() && in_range(text[end], 0x30, 0x3F)) {
        ++end;
    }
    while (end < text.size() && in_range(text[end], 0x20, 0x2F)) {
        ++end;
    }
    if (end < text.size() && in_range(text[end], 0x40, 0x7E)) {
        return end + 1 - pos;
    }

    return 0;
}

} // namespace

std::string normalize_line_endings(std::string_view text) {
    std::string res;
    res.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') {
            res += text[i];
            continue;
        }

        res += '\n';
        if (i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
        }
    }

    return res;
}

std::string strip_ansi_escapes(std::string_view text) {
    std::string res;
    res.reserve(text.size());

    for (std::size_t i = 0; i < text.size();) {
        if (text[i] == ESC) {
            if (std::size_t len = escape_sequence_length(text, i); len != 0) {
                i += len;
                continue;
            }
        }
        res += text[i];
        ++i;
    }

    return res;
}

CapturedStream normalize_stream(std::string_view raw, bool overflowed, const ExecutionPolicy& policy) {
    std::string text = policy.strip_ansi_escapes ? normalize_line_endings(strip_ansi_escapes(raw))
                                                 : normalize_line_endings(raw);

    bool truncated = overflowed;

    if (text.size() > policy.max_output_bytes) {
        text.resize(utf8::safe_prefix_length(text, policy.max_output_bytes));
        truncated = true;
    }

    return {.text = std::move(text), .truncated = truncated};
}

ExecutionResult normalize(const RawCapture& raw, Outcome outcome, const ExecutionPolicy& policy) {
    CapturedStream out = normalize_stream(raw.stdout_data, raw.stdout_overflowed, policy);
    CapturedStream err = normalize_stream(raw.stderr_data, raw.stderr_overflowed, policy);

    LOG_DEBUG("Normalized output: stdout {}B{}, stderr {}B{}", out.text.size(), out.truncated ? " (truncated)" : "",
              err.text.size(), err.truncated ? " (truncated)" : "");

    std::vector<std::string> diagnostics;
    if (outcome == Outcome::InternalError && !raw.internal_error.empty()) {
        diagnostics.push_back(raw.internal_error);
    }

    return {outcome, std::move(out), std::move(err), raw.exit_status, raw.elapsed, std::move(diagnostics),
            raw.cancelled};
}

} // namespace gradebox
