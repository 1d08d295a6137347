/// @file clock.cpp
/// @brief Clock implementation

#include <media_engine/core/clock.hpp>

#include <vector>

namespace media_core {

ScheduleHandle Clock::add(Callback callback, std::chrono::milliseconds interval, bool repeat) {
    ScheduleHandle handle{m_next_id++};

    Entry entry;
    entry.callback = std::move(callback);
    entry.interval = interval;
    entry.next_due = std::chrono::steady_clock::now() + interval;
    entry.repeat = repeat;

    m_entries.emplace(handle.id, std::move(entry));
    return handle;
}

ScheduleHandle Clock::schedule_interval(Callback callback, std::chrono::milliseconds interval) {
    return add(std::move(callback), interval, true);
}

ScheduleHandle Clock::schedule_once(Callback callback, std::chrono::milliseconds delay) {
    return add(std::move(callback), delay, false);
}

bool Clock::unschedule(ScheduleHandle handle) {
    return m_entries.erase(handle.id) > 0;
}

bool Clock::is_scheduled(ScheduleHandle handle) const {
    return m_entries.count(handle.id) > 0;
}

std::size_t Clock::tick() {
    return tick(std::chrono::steady_clock::now());
}

std::size_t Clock::tick(TimePoint now) {
    ++m_frames;

    // Snapshot ids so callbacks may schedule or unschedule freely
    std::vector<std::uint64_t> due;
    due.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        if (entry.next_due <= now) {
            due.push_back(id);
        }
    }

    std::size_t ran = 0;
    for (std::uint64_t id : due) {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            continue;
        }

        // Copy: the callback may unschedule itself and destroy the entry
        Callback callback = it->second.callback;
        if (it->second.repeat) {
            it->second.next_due = now + it->second.interval;
        } else {
            m_entries.erase(it);
        }

        if (callback) {
            callback();
            ++ran;
        }
    }

    return ran;
}

} // namespace media_core
