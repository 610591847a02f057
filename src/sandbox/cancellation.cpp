#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/cancellation.hpp>

#include <cstdint>
#include <string_view>

#include <sys/eventfd.h>

namespace gradebox {

CancellationToken::CancellationToken() {
    auto res = linux::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK); // NOLINT(*-signed-bitwise)

    if (!res) {
        LOG_WARN("Could not create a cancellation eventfd ('{}'); cancellation will be polled",
                 res.error().message());
        return;
    }

    event_fd_ = *res;
}

CancellationToken::~CancellationToken() {
    if (event_fd_ == -1) {
        return;
    }

    if (auto res = linux::close(event_fd_); !res) {
        LOG_WARN("Failed to close cancellation eventfd: '{}'", res.error().message());
    }
}

void CancellationToken::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    LOG_DEBUG("Cancellation requested");

    if (event_fd_ == -1) {
        return;
    }

    const std::uint64_t one = 1;
    std::string_view bytes{reinterpret_cast<const char*>(&one), sizeof(one)}; // NOLINT(*-reinterpret-cast)

    if (auto res = linux::write(event_fd_, bytes); !res) {
        LOG_WARN("Failed to signal cancellation eventfd: '{}'", res.error().message());
    }
}

} // namespace gradebox
