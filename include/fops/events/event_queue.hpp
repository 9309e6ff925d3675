/**
 * @file event_queue.hpp
 * @brief Bounded thread-safe queue handing events from workers to the host
 *
 * WHY THIS FILE EXISTS:
 * Event handlers run on operation worker threads. A host that renders
 * on its own thread drains events from this queue instead, so workers
 * never wait on the UI.
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::string> queue(1024);
 * queue.push(line);                        // Worker
 * auto line = queue.pop_for(100ms);        // Host (bounded wait)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace fops::events {

/**
 * @brief Thread-safe FIFO queue with an optional capacity
 *
 * When full, push() drops the oldest item. A host that stops draining
 * loses stale progress lines rather than growing memory without bound.
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - Uses condition variable for blocking wait
 */
template<typename T>
class ThreadSafeQueue {
public:
    /// capacity == 0 means unbounded
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    // Non-copyable
    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (capacity_ > 0 && queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Try to pop item (non-blocking)
     *
     * RETURNS: Item if available, nullopt if queue empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front();
    }

    /**
     * @brief Pop item with timeout
     *
     * RETURNS: Item if available within timeout, nullopt on timeout
     *          or once shut down and empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        });
        return take_front();
    }

    /// Remove and return everything queued so far
    std::vector<T> drain() {
        std::unique_lock lock(mutex_);
        std::vector<T> items;
        items.reserve(queue_.size());
        while (!queue_.empty()) {
            items.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return items;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Items discarded because the queue was full
    size_t dropped() const {
        std::unique_lock lock(mutex_);
        return dropped_;
    }

    /**
     * @brief Signal shutdown (wake up all waiting threads)
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
    bool shutdown_ = false;
};

} // namespace fops::events
