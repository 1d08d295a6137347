/// @file boot.cpp
/// @brief BootHolds implementation

#include <media_engine/core/boot.hpp>
#include <media_engine/core/log.hpp>

namespace media_core {

void BootHolds::add_boot_hold(const std::string& hold) {
    if (m_complete) {
        event_logger()->warn("Ignoring boot hold '{}' added after boot completed", hold);
        return;
    }
    m_holds.insert(hold);
    event_logger()->debug("Boot hold '{}' added ({} active)", hold, m_holds.size());
}

void BootHolds::clear_boot_hold(const std::string& hold) {
    if (m_holds.erase(hold) == 0) {
        event_logger()->debug("Boot hold '{}' was not held", hold);
        return;
    }

    event_logger()->debug("Boot hold '{}' cleared ({} remaining)", hold, m_holds.size());

    if (m_holds.empty() && !m_complete) {
        m_complete = true;
        event_logger()->info("Boot complete");

        auto callbacks = std::move(m_ready_callbacks);
        m_ready_callbacks.clear();
        for (auto& callback : callbacks) {
            if (callback) {
                callback();
            }
        }
    }
}

} // namespace media_core
