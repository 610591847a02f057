#pragma once

#include <string>
#include <string_view>

namespace gradebox {

/// Destination for rendered report text
class Sink
{
public:
    virtual void write(std::string_view str) = 0;
    virtual void flush() = 0;

    virtual ~Sink() = default;
};

/// Keeps everything written to it in memory
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }
    void flush() override {}

    const std::string& str() const { return buffer_; }

private:
    std::string buffer_;
};

} // namespace gradebox
