#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for media_core module

#include <cstdint>

namespace media_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Runtime Services
// =============================================================================

class CrashChannel;
struct CrashReport;

class Clock;
struct ScheduleHandle;

class BootGate;
class BootHolds;

struct LogConfig;

} // namespace media_core
