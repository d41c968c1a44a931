#include "util/CancellationToken.hpp"

namespace util {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

auto CancellationToken::is_cancelled() const -> bool {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

auto CancellationToken::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

}  // namespace util
