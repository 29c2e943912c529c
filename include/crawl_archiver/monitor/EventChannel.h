#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "MonitorEvent.h"

namespace crawl_archiver { namespace monitor {

/**
 * Bounded FIFO from the monitor thread to the control loop.
 * When full, the oldest event is dropped.
 */
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 64) : capacity_(capacity == 0 ? 1 : capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void push(MonitorEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    // Wait up to `timeout` for the next event
    template <typename Rep, typename Period>
    std::optional<MonitorEvent> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        MonitorEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    std::optional<MonitorEvent> tryPop() {
        return popFor(std::chrono::milliseconds(0));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    size_t capacity_;
    std::deque<MonitorEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} } // namespace crawl_archiver::monitor
