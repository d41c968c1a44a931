#include "util/SignalWatcher.hpp"

#include "util/Logger.hpp"

#include <pthread.h>

#include <cstring>
#include <format>

namespace util {

namespace {
// Sent by the destructor to release sigwait()
constexpr int STOP_SIGNAL = SIGUSR1;
}  // namespace

SignalWatcher::SignalWatcher(CancellationToken& token) : token_(token) {
    sigemptyset(&watched_);
    sigaddset(&watched_, SIGINT);
    sigaddset(&watched_, SIGTERM);
    sigaddset(&watched_, STOP_SIGNAL);

    if (int rc = pthread_sigmask(SIG_BLOCK, &watched_, &previous_mask_); rc != 0) {
        LOG_ERROR("SignalWatcher", std::format("Failed to block signals: {}", std::strerror(rc)));
    }

    thread_ = std::thread([this]() { run(); });
}

SignalWatcher::~SignalWatcher() {
    if (thread_.joinable()) {
        pthread_kill(thread_.native_handle(), STOP_SIGNAL);
        thread_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::run() {
    while (true) {
        int signal_number = 0;
        if (int rc = sigwait(&watched_, &signal_number); rc != 0) {
            LOG_ERROR("SignalWatcher", std::format("sigwait failed: {}", std::strerror(rc)));
            return;
        }

        if (signal_number == STOP_SIGNAL) {
            return;
        }

        LOG_INFO("SignalWatcher",
                 std::format("Received {}, exiting main loop...", strsignal(signal_number)));
        token_.cancel();
    }
}

}  // namespace util
