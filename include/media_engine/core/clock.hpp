#pragma once

/// @file clock.hpp
/// @brief Main-thread interval scheduler
///
/// The host drives the clock by calling tick() once per frame (or from any
/// periodic timer). Scheduled callbacks run on the ticking thread. The clock
/// is not thread-safe; schedule and tick from the same thread.

#include "fwd.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace media_core {

// =============================================================================
// ScheduleHandle
// =============================================================================

/// Identifies a scheduled callback
struct ScheduleHandle {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr bool operator==(const ScheduleHandle&) const noexcept = default;
};

// =============================================================================
// Clock
// =============================================================================

class Clock {
public:
    using Callback = std::function<void()>;
    using TimePoint = std::chrono::steady_clock::time_point;

    Clock() = default;

    // Non-copyable
    Clock(const Clock&) = delete;
    Clock& operator=(const Clock&) = delete;

    /// Run callback on every tick at least `interval` apart.
    /// A zero interval runs it on every tick.
    ScheduleHandle schedule_interval(Callback callback,
                                     std::chrono::milliseconds interval = std::chrono::milliseconds{0});

    /// Run callback once, on the first tick after `delay`
    ScheduleHandle schedule_once(Callback callback,
                                 std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    /// Remove a scheduled callback. Safe to call from inside a callback.
    /// @return true if it was scheduled
    bool unschedule(ScheduleHandle handle);

    /// Check whether a handle is still scheduled
    [[nodiscard]] bool is_scheduled(ScheduleHandle handle) const;

    /// Number of scheduled callbacks
    [[nodiscard]] std::size_t scheduled_count() const noexcept { return m_entries.size(); }

    /// Run due callbacks using the current time
    /// @return Number of callbacks run
    std::size_t tick();

    /// Run due callbacks as of `now`
    std::size_t tick(TimePoint now);

    /// Number of ticks so far
    [[nodiscard]] std::uint64_t frame_count() const noexcept { return m_frames; }

private:
    struct Entry {
        Callback callback;
        std::chrono::milliseconds interval{0};
        TimePoint next_due{};
        bool repeat = true;
    };

    ScheduleHandle add(Callback callback, std::chrono::milliseconds interval, bool repeat);

    std::map<std::uint64_t, Entry> m_entries;
    std::uint64_t m_next_id = 1;
    std::uint64_t m_frames = 0;
};

} // namespace media_core
