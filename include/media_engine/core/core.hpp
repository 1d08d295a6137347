#pragma once

/// @file core.hpp
/// @brief Main include file for media_core module
///
/// This header includes all media_core components in dependency order.

#include "fwd.hpp"

// Core types
#include "error.hpp"
#include "strings.hpp"
#include "config.hpp"

// Runtime services
#include "log.hpp"
#include "crash.hpp"
#include "clock.hpp"
#include "boot.hpp"

/// @namespace media_core
/// @brief Core infrastructure module
///
/// media_core provides the foundational types used by the asset pipeline:
///
/// - **Error Handling**: Result<T> error handling with typed error kinds
/// - **Logging**: spdlog named loggers per subsystem
/// - **Crash Reporting**: CrashChannel for failures on worker threads
/// - **Scheduling**: Clock for main-thread interval callbacks
/// - **Boot Holds**: BootGate preconditions for startup
///
/// Example usage:
/// @code
/// #include <media_engine/core/core.hpp>
///
/// using namespace media_core;
///
/// Clock clock;
/// BootHolds boot;
/// boot.add_boot_hold("assets");
///
/// auto handle = clock.schedule_interval([&] {
///     boot.clear_boot_hold("assets");
/// });
///
/// while (!boot.is_boot_complete()) {
///     clock.tick();
/// }
/// clock.unschedule(handle);
/// @endcode

namespace media_core {

/// Library version string
inline constexpr const char* MEDIA_CORE_VERSION = "0.1.0";

} // namespace media_core
