#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace crawl_archiver {

/**
 * Process-wide cancellation flag shared by every long-running component.
 * Set once by the signal thread, observed cooperatively at loop boundaries.
 */
class ShutdownToken {
public:
    ShutdownToken() = default;
    ShutdownToken(const ShutdownToken&) = delete;
    ShutdownToken& operator=(const ShutdownToken&) = delete;

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
        }
        cv_.notify_all();
    }

    bool isStopRequested() const { return stopRequested_.load(); }

    /**
     * Sleep for up to `timeout`, returning early when a stop is requested.
     * @return true if a stop was requested (before or during the wait)
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopRequested_.load(); });
    }

private:
    std::atomic<bool> stopRequested_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace crawl_archiver
