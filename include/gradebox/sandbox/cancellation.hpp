#pragma once

#include <gradebox/common/class_traits.hpp>

#include <atomic>

namespace gradebox {

/// Lets another thread end a running execution early. Cancelling forces the same termination path
/// as a timeout: the whole process group is killed and the result is `Timeout` with `cancelled`
/// set.
///
/// Shared by address with the supervising thread, so it must outlive the run it is passed to.
class CancellationToken : public NonMovable
{
public:
    CancellationToken();
    ~CancellationToken();

    /// Thread-safe and idempotent
    void cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Becomes readable once `cancel()` has been called. -1 if no eventfd could be created,
    /// in which case supervisors fall back to checking `is_cancelled()` periodically.
    int fd() const { return event_fd_; }

private:
    std::atomic<bool> cancelled_{false};
    int event_fd_ = -1;
};

} // namespace gradebox
