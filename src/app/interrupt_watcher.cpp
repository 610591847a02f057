#include "app/interrupt_watcher.hpp"

#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/cancellation.hpp>

#include <cerrno>
#include <ctime>
#include <stop_token>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace gradebox {

namespace {

/// How often the watcher checks whether it should stop
constexpr timespec WAKEUP_INTERVAL{.tv_sec = 0, .tv_nsec = 100'000'000};

} // namespace

InterruptWatcher::InterruptWatcher(CancellationToken& token)
    : token_{token} {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);

    if (int err = pthread_sigmask(SIG_BLOCK, &signals_, &old_mask_); err != 0) {
        LOG_WARN("Could not block SIGINT/SIGTERM ('{}'); interrupting will not stop submissions cleanly",
                 get_err_msg(err));
        return;
    }
    mask_changed_ = true;

    thread_ = std::jthread{[this](const std::stop_token& stop) { watch(stop); }};
}

InterruptWatcher::~InterruptWatcher() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    if (!mask_changed_) {
        return;
    }

    if (int err = pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr); err != 0) {
        LOG_WARN("Could not restore the signal mask: '{}'", get_err_msg(err));
    }
}

void InterruptWatcher::watch(const std::stop_token& stop) {
    while (!stop.stop_requested()) {
        siginfo_t info{};
        const int sig = sigtimedwait(&signals_, &info, &WAKEUP_INTERVAL);

        if (sig == -1) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }

            LOG_ERROR("sigtimedwait failed: '{}'; interrupts will no longer cancel submissions", get_err_msg());
            return;
        }

        if (token_.is_cancelled()) {
            LOG_WARN("Received {} again; still waiting for running submissions to be killed", linux::Signal{sig});
            continue;
        }

        LOG_WARN("Received {}; killing running submissions", linux::Signal{sig});
        token_.cancel();
    }
}

} // namespace gradebox
