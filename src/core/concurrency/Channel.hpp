/**
 * @file Channel.hpp
 * @brief Single-producer/single-consumer FIFO between threads.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace nettune::core {

/**
 * @brief Unbounded FIFO handing values from a worker thread to a consumer.
 *
 * The consumer polls with tryReceive() without blocking. Closing the channel
 * tells the producer that nobody is listening any more: subsequent send()
 * calls fail and drop the value. Values already queued stay receivable.
 *
 * Shared between both sides through std::shared_ptr.
 *
 * @tparam T Value type; ownership moves to the receiver.
 */
template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueues a value.
     * @return False if the channel is closed; the value is discarded.
     */
    bool send(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Takes the oldest queued value without blocking.
     */
    std::optional<T> tryReceive() {
        std::lock_guard lock(mutex_);
        return popFront();
    }

    /**
     * @brief Waits up to timeout for a value.
     * @return The oldest value, or nullopt on timeout or when closed and empty.
     */
    template <typename Rep, typename Period>
    std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return popFront();
    }

    /**
     * @brief Closes the channel. Further sends fail; blocked receivers wake up.
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> popFront() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace nettune::core
