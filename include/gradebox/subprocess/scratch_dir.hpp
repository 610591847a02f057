#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/expected.hpp>

#include <string>
#include <string_view>

namespace gradebox {

/// A private temporary directory that exists for the lifetime of this object.
/// The directory and everything in it is removed on destruction.
class ScratchDir : public NonCopyable
{
public:
    /// Create a fresh directory (mode 0700) under the system temporary directory
    static Expected<ScratchDir> create(std::string_view name_prefix = "gradebox-");

    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& rhs) noexcept;
    ~ScratchDir();

    const std::string& path() const { return path_; }

    /// Write `contents` to a new file `name` inside the directory. Returns the file's full path.
    Expected<std::string> write_file(std::string_view name, std::string_view contents) const;

private:
    explicit ScratchDir(std::string path)
        : path_{std::move(path)} {}

    void remove();

    /// Empty once moved from
    std::string path_;
};

} // namespace gradebox
