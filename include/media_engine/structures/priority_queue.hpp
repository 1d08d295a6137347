#pragma once

/// @file priority_queue.hpp
/// @brief Priority queue with timed blocking pop for media_structures
///
/// PriorityBlockingQueue orders values by an explicit "precedes" relation:
/// `precedes(a, b)` is true when `a` must be popped before `b`. The relation
/// must be a strict weak ordering; make it a strict total order to get fully
/// deterministic pop order.

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace media_structures {

/// Thread-safe priority queue
/// @tparam T Stored value type (must be movable)
/// @tparam Precedes Binary predicate, true when the first argument pops first
template<typename T, typename Precedes = std::less<T>>
class PriorityBlockingQueue {
public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create empty queue
    explicit PriorityBlockingQueue(Precedes precedes = Precedes{})
        : precedes_(std::move(precedes)) {}

    // Non-copyable, non-movable (owns a mutex)
    PriorityBlockingQueue(const PriorityBlockingQueue&) = delete;
    PriorityBlockingQueue& operator=(const PriorityBlockingQueue&) = delete;
    PriorityBlockingQueue(PriorityBlockingQueue&&) = delete;
    PriorityBlockingQueue& operator=(PriorityBlockingQueue&&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Insert value and wake one waiting consumer
    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            heap_.push_back(std::move(value));
            std::push_heap(heap_.begin(), heap_.end(), heap_order());
        }
        not_empty_.notify_one();
    }

    /// Pop the first value without blocking
    /// @return Value if available, nullopt if empty
    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    /// Pop the first value, waiting up to `timeout` for one to arrive
    /// @return Value if one arrived in time, nullopt otherwise
    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return !heap_.empty(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    /// Remove every queued value
    /// @return Values in pop order
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        out.reserve(heap_.size());
        while (auto value = pop_locked()) {
            out.push_back(std::move(*value));
        }
        return out;
    }

    /// Discard every queued value
    void clear() {
        std::lock_guard lock(mutex_);
        heap_.clear();
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Check if queue is empty
    /// @note This is a snapshot - may change immediately after call
    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return heap_.empty();
    }

    /// Get size
    /// @note This is a snapshot - may change immediately after call
    [[nodiscard]] size_type size() const {
        std::lock_guard lock(mutex_);
        return heap_.size();
    }

private:
    /// std heap algorithms keep the maximum at the front; the element that
    /// precedes all others is treated as the maximum.
    auto heap_order() const {
        return [this](const T& a, const T& b) { return precedes_(b, a); };
    }

    std::optional<T> pop_locked() {
        if (heap_.empty()) {
            return std::nullopt;
        }
        std::pop_heap(heap_.begin(), heap_.end(), heap_order());
        std::optional<T> value(std::move(heap_.back()));
        heap_.pop_back();
        return value;
    }

    Precedes precedes_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::vector<T> heap_;
};

} // namespace media_structures
