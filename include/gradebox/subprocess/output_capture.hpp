#pragma once

#include <gradebox/common/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace gradebox {

/// Accumulates a child's output stream up to a fixed number of bytes. Anything past the limit is
/// counted but dropped, so a runaway child cannot exhaust the supervisor's memory.
class OutputCapture
{
public:
    explicit OutputCapture(std::size_t retain_limit)
        : retain_limit_{retain_limit} {}

    void append(std::string_view chunk);

    /// Read everything currently available from the non-blocking descriptor `fd`
    /// Returns whether end-of-file was reached
    Expected<bool> read_available(int fd);

    const std::string& data() const { return data_; }

    std::string take() { return std::move(data_); }

    /// Whether bytes were dropped because of the retain limit
    bool overflowed() const { return total_bytes_ > data_.size(); }

    std::size_t total_bytes() const { return total_bytes_; }

private:
    static constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

    std::size_t retain_limit_;
    std::size_t total_bytes_ = 0;
    std::string data_;
};

} // namespace gradebox
