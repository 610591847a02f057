#include <gradebox/common/error_types.hpp>
#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/subprocess/scratch_dir.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>

namespace gradebox {

Expected<ScratchDir> ScratchDir::create(std::string_view name_prefix) {
    std::error_code err;
    std::filesystem::path base = std::filesystem::temp_directory_path(err);

    if (err) {
        LOG_DEBUG("No usable temporary directory: '{}'", err.message());
        return err;
    }

    auto templ = (base / fmt::format("{}XXXXXX", name_prefix)).string();
    auto path = TRY(linux::mkdtemp(std::move(templ)));

    LOG_TRACE("Created scratch directory {:?}", path);

    return ScratchDir{std::move(path)};
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

ScratchDir& ScratchDir::operator=(ScratchDir&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

ScratchDir::~ScratchDir() {
    remove();
}

void ScratchDir::remove() {
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove scratch directory {:?}: '{}'", path_, err.message());
    } else {
        LOG_TRACE("Removed scratch directory {:?}", path_);
    }

    path_.clear();
}

Expected<std::string> ScratchDir::write_file(std::string_view name, std::string_view contents) const {
    std::string file_path = fmt::format("{}/{}", path_, name);

    // NOLINTNEXTLINE(*-signed-bitwise)
    int fd = TRY(linux::open(file_path, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    auto close_fd = gsl::finally([fd] {
        if (auto res = linux::close(fd); !res) {
            LOG_WARN("Failed to close fd {}: '{}'", fd, res.error().message());
        }
    });

    while (!contents.empty()) {
        auto written = linux::write(fd, contents);

        if (!written) {
            if (written.error() == std::errc::interrupted) {
                continue;
            }
            return written.error();
        }

        contents.remove_prefix(*written);
    }

    return file_path;
}

} // namespace gradebox
