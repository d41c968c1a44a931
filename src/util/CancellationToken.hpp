/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag with an interruptible wait
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace util {

/**
 * @class CancellationToken
 * @brief Shared stop request observed by long-running loops
 *
 * cancel() may be called from any thread. wait_for() returns early as soon
 * as cancellation is requested, so a sleeping loop reacts promptly.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Request cancellation and wake every waiter
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Sleep for up to @p timeout
     * @return true if cancellation was requested (before or during the wait)
     */
    auto wait_for(std::chrono::milliseconds timeout) -> bool;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace util
