#pragma once

/// @file blocking_queue.hpp
/// @brief Unbounded FIFO queue with timed blocking pop for media_structures
///
/// BlockingQueue is a mutex/condition-variable MPMC queue. Consumers can wait
/// for a value with a timeout, so a worker thread can poll a stop flag between
/// waits without spinning.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace media_structures {

/// Thread-safe unbounded FIFO queue
/// @tparam T Stored value type (must be movable)
template<typename T>
class BlockingQueue {
public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create empty queue
    BlockingQueue() = default;

    // Non-copyable, non-movable (owns a mutex)
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;
    BlockingQueue(BlockingQueue&&) = delete;
    BlockingQueue& operator=(BlockingQueue&&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Push value to back of queue and wake one waiting consumer
    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(value));
        }
        not_empty_.notify_one();
    }

    /// Pop value from front without blocking
    /// @return Value if available, nullopt if empty
    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    /// Pop value from front, waiting up to `timeout` for one to arrive
    /// @return Value if one arrived in time, nullopt otherwise
    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    /// Remove every queued value
    /// @return Values in queue order
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) {
            out.push_back(std::move(item));
        }
        items_.clear();
        return out;
    }

    /// Discard every queued value
    void clear() {
        std::lock_guard lock(mutex_);
        items_.clear();
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Check if queue is empty
    /// @note This is a snapshot - may change immediately after call
    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return items_.empty();
    }

    /// Get size
    /// @note This is a snapshot - may change immediately after call
    [[nodiscard]] size_type size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(items_.front()));
        items_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
};

} // namespace media_structures
