/**
 * @file SignalWatcher.hpp
 * @brief Turns SIGINT/SIGTERM into a cancellation request
 */

#pragma once

#include "util/CancellationToken.hpp"

#include <signal.h>

#include <thread>

namespace util {

/**
 * @class SignalWatcher
 * @brief Dedicated sigwait() thread that cancels a token on termination signals
 *
 * Construct it before any other thread is started: it blocks SIGINT and
 * SIGTERM in the calling thread, and threads created afterwards inherit
 * that mask, so only the watcher ever receives them. No async-signal
 * handler and no global flag is involved.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run();

    CancellationToken& token_;
    sigset_t watched_{};
    sigset_t previous_mask_{};
    std::thread thread_;
};

}  // namespace util
