#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/subprocess/output_capture.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace gradebox {

void OutputCapture::append(std::string_view chunk) {
    total_bytes_ += chunk.size();

    std::size_t room = retain_limit_ > data_.size() ? retain_limit_ - data_.size() : 0;
    data_.append(chunk.substr(0, std::min(room, chunk.size())));
}

Expected<bool> OutputCapture::read_available(int fd) {
    while (true) {
        auto res = linux::read(fd, READ_CHUNK_SIZE);

        if (!res) {
            if (linux::is_would_block(res.error())) {
                return false;
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return res.error();
        }

        if (res->empty()) {
            return true;
        }

        append(*res);
    }
}

} // namespace gradebox
