/**
 * @file channel.hpp
 * @brief Bounded multi-producer channel for upload outcomes
 *
 * WHY THIS FILE EXISTS:
 * Upload workers report outcomes as they finish. A bounded channel hands
 * them to one observer thread; when the observer falls behind, send() blocks
 * and the workers stop pulling new assets.
 *
 * EXAMPLE:
 * BoundedChannel<UploadOutcome> channel(16);
 * channel.send(outcome);             // Worker (blocks while full)
 * auto outcome = channel.receive();  // Observer (blocks until available)
 * channel.close();                   // Either side: no more traffic
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace immich::upload {

/**
 * @brief Thread-safe FIFO with a fixed capacity and a close flag
 *
 * THREAD SAFETY:
 * - Multiple producers can send concurrently
 * - Multiple consumers can receive concurrently
 * - close() wakes every blocked sender and receiver
 *
 * After close(), send() fails while receive() keeps draining what was
 * already queued and then returns nullopt.
 */
template<typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Queue an item, waiting for room
     *
     * RETURNS: false if the channel is (or becomes) closed; the item is dropped
     * BLOCKS: Yes, while the channel is full
     */
    bool send(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || closed_;
            });

            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Queue an item only if there is room right now
     *
     * BLOCKS: No
     */
    bool try_send(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Take the oldest item
     *
     * RETURNS: Item, or nullopt once the channel is closed and drained
     * BLOCKS: Yes, until an item arrives or the channel closes
     */
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return take(lock);
    }

    /**
     * @brief Take the oldest item if one is queued
     *
     * BLOCKS: No
     */
    std::optional<T> try_receive() {
        std::unique_lock lock(mutex_);
        return take(lock);
    }

    /**
     * @brief Take the oldest item, waiting at most timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        })) {
            return std::nullopt;  // Timeout
        }
        return take(lock);
    }

    /**
     * @brief Stop all further sends and wake every waiter
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    bool closed_ = false;
};

} // namespace immich::upload
