#pragma once

#include <cstddef>
#include <string_view>

namespace gradebox::utf8 {

/// Number of bytes in the well-formed UTF-8 sequence that starts at `text[pos]`, or 0 if the
/// bytes there are not one (stray continuation byte, overlong form, surrogate, > U+10FFFF, or
/// a sequence cut short by the end of `text`).
constexpr std::size_t sequence_length(std::string_view text, std::size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }

    auto byte = [&](std::size_t idx) { return static_cast<unsigned char>(text[idx]); };
    auto is_cont = [&](std::size_t idx) { return idx < text.size() && (byte(idx) & 0xC0U) == 0x80U; };

    const unsigned char lead = byte(pos);

    if (lead < 0x80U) {
        return 1;
    }
    if (lead < 0xC2U) {
        // continuation byte, or an overlong 2-byte lead
        return 0;
    }
    if (lead < 0xE0U) {
        return is_cont(pos + 1) ? 2 : 0;
    }
    if (lead < 0xF0U) {
        if (!is_cont(pos + 1) || !is_cont(pos + 2)) {
            return 0;
        }
        const unsigned char second = byte(pos + 1);
        if (lead == 0xE0U && second < 0xA0U) {
            return 0; // overlong
        }
        if (lead == 0xEDU && second >= 0xA0U) {
            return 0; // UTF-16 surrogate
        }
        return 3;
    }
    if (lead < 0xF5U) {
        if (!is_cont(pos + 1) || !is_cont(pos + 2) || !is_cont(pos + 3)) {
            return 0;
        }
        const unsigned char second = byte(pos + 1);
        if (lead == 0xF0U && second < 0x90U) {
            return 0; // overlong
        }
        if (lead == 0xF4U && second >= 0x90U) {
            return 0; // beyond U+10FFFF
        }
        return 4;
    }

    return 0;
}

/// Position of the first byte that does not begin a well-formed sequence, or `npos` if
/// all of `text` is valid UTF-8
constexpr std::size_t find_invalid(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = sequence_length(text, pos);
        if (len == 0) {
            return pos;
        }
        pos += len;
    }
    return std::string_view::npos;
}

/// Largest `n <= max_len` such that `text.substr(0, n)` does not end partway through a
/// multi-byte sequence. Bytes that are not valid UTF-8 count as single units.
constexpr std::size_t safe_prefix_length(std::string_view text, std::size_t max_len) {
    if (max_len >= text.size()) {
        return text.size();
    }

    std::size_t pos = 0;
    while (pos < max_len) {
        std::size_t len = sequence_length(text, pos);
        if (len == 0) {
            len = 1;
        }
        if (pos + len > max_len) {
            break;
        }
        pos += len;
    }
    return pos;
}

} // namespace gradebox::utf8
