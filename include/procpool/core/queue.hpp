#pragma once

/**
 * @file queue.hpp
 * @brief Unbounded, thread-safe FIFO queue
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace procpool {

/**
 * @brief Queue statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Unbounded MPMC (Multi-Producer Multi-Consumer) queue
 *
 * Pushes never block: the pool has no submission limit. Pops block on a
 * condition variable until an item arrives or the queue is closed.
 *
 * @tparam T Item type (must be movable)
 */
template<typename T>
class UnboundedQueue {
public:
    UnboundedQueue() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    UnboundedQueue(const UnboundedQueue&) = delete;
    UnboundedQueue& operator=(const UnboundedQueue&) = delete;
    UnboundedQueue(UnboundedQueue&&) = delete;
    UnboundedQueue& operator=(UnboundedQueue&&) = delete;

    /**
     * @brief Append an item
     * @return true if pushed, false if queue is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }

            items_.push_back(std::move(item));
            stats_.push_count++;
            if (items_.size() > stats_.high_watermark) {
                stats_.high_watermark = items_.size();
            }
            stats_.current_size = items_.size();
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop an item, blocking if empty
     * @return Item if available, nullopt if queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        while (items_.empty() && !closed_) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }

        return take_front();
    }

    /**
     * @brief Try to pop without blocking
     * @return Item if available, nullopt if empty
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    /**
     * @brief Pop with timeout
     * @param timeout Maximum wait duration
     * @return Item if available, nullopt if timeout or closed+empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_empty_.wait_for(lock, timeout, [this] {
            return !items_.empty() || closed_;
        })) {
            stats_.pop_blocked_count++;
            return std::nullopt;
        }

        return take_front();
    }

    /**
     * @brief Close the queue (no more pushes accepted)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    /**
     * @brief Drop every queued item
     * @return Number of items dropped
     */
    std::size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dropped = items_.size();
        items_.clear();
        stats_.current_size = 0;
        return dropped;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        stats_.pop_count++;
        stats_.current_size = items_.size();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;

    std::deque<T> items_;
    bool closed_{false};

    QueueStats stats_;
};

} // namespace procpool
