#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/sandbox/cancellation.hpp>

#include <thread>

#include <signal.h>

namespace gradebox {

/// Turns SIGINT and SIGTERM into a cancellation of every running submission.
///
/// Must be created before any other thread, since it works by blocking both signals in the
/// calling thread, whose mask new threads inherit. The previous mask is restored on destruction.
class InterruptWatcher : public NonMovable
{
public:
    explicit InterruptWatcher(CancellationToken& token);
    ~InterruptWatcher();

private:
    void watch(const std::stop_token& stop);

    CancellationToken& token_;
    sigset_t signals_{};
    sigset_t old_mask_{};
    bool mask_changed_ = false;
    std::jthread thread_;
};

} // namespace gradebox
