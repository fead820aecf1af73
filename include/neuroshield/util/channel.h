// NeuroShield - Message Channel
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Unbounded multi-producer / multi-consumer FIFO. The ledger publishes
// committed events into channels; consumers (the mirror) drain them on
// their own threads. Nothing is shared between the two sides except the
// channel itself.

#ifndef NEUROSHIELD_UTIL_CHANNEL_H
#define NEUROSHIELD_UTIL_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace neuroshield {
namespace util {

template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Enqueue an item. Returns false if the channel is closed.
    bool Send(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        condition_.notify_one();
        return true;
    }

    /// Block until an item is available or the channel is closed and drained.
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    /// Like Receive() but gives up after timeout.
    template<typename Rep, typename Period>
    std::optional<T> ReceiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    /// Non-blocking receive
    std::optional<T> TryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return PopLocked();
    }

    /// Reject further sends and wake all receivers. Queued items remain
    /// receivable.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        condition_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> PopLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace util
} // namespace neuroshield

#endif // NEUROSHIELD_UTIL_CHANNEL_H
