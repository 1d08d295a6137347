#pragma once

/// @file boot.hpp
/// @brief Boot holds: named preconditions the host waits on before it is ready

#include "fwd.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace media_core {

// =============================================================================
// BootGate
// =============================================================================

/// Narrow interface for subsystems that hold up startup
class BootGate {
public:
    virtual ~BootGate() = default;

    /// Check whether startup has completed
    [[nodiscard]] virtual bool is_boot_complete() const = 0;

    /// Release the named hold
    virtual void clear_boot_hold(const std::string& hold) = 0;
};

// =============================================================================
// BootHolds
// =============================================================================

/// Default BootGate: boot completes once every added hold is cleared
class BootHolds : public BootGate {
public:
    using ReadyCallback = std::function<void()>;

    BootHolds() = default;

    /// Add a named hold. Ignored after boot has completed.
    void add_boot_hold(const std::string& hold);

    /// Release a hold. Completes boot when it was the last one.
    void clear_boot_hold(const std::string& hold) override;

    [[nodiscard]] bool is_boot_complete() const override { return m_complete; }

    /// Check whether a hold is still active
    [[nodiscard]] bool is_held(const std::string& hold) const { return m_holds.count(hold) > 0; }

    /// Active holds
    [[nodiscard]] const std::set<std::string>& holds() const noexcept { return m_holds; }

    /// Called once when the last hold is cleared
    void on_ready(ReadyCallback callback) { m_ready_callbacks.push_back(std::move(callback)); }

private:
    std::set<std::string> m_holds;
    std::vector<ReadyCallback> m_ready_callbacks;
    bool m_complete = false;
};

} // namespace media_core
