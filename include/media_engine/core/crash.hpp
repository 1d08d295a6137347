#pragma once

/// @file crash.hpp
/// @brief Crash reporting channel for background threads
///
/// Worker threads never fail silently: a failure that escapes a worker loop
/// is formatted and posted here, and the owning thread decides how to crash.

#include "fwd.hpp"
#include "error.hpp"
#include <chrono>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_core {

// =============================================================================
// CrashReport
// =============================================================================

/// A failure captured on a background thread
struct CrashReport {
    std::string thread_name;
    std::string message;
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();

    /// Multi-line human readable form
    [[nodiscard]] std::string formatted() const;
};

/// Describe the exception currently being handled, including nested causes.
/// Must be called from inside a catch block.
[[nodiscard]] std::string describe_current_exception();

/// Describe an exception pointer, including nested causes
[[nodiscard]] std::string describe_exception(std::exception_ptr ptr);

// =============================================================================
// CrashChannel
// =============================================================================

/// Thread-safe queue of crash reports, drained by the main thread
class CrashChannel {
public:
    CrashChannel() = default;

    // Non-copyable, non-movable
    CrashChannel(const CrashChannel&) = delete;
    CrashChannel& operator=(const CrashChannel&) = delete;

    /// Post a report (any thread)
    void report(CrashReport report);

    /// Post a report built from a thread name and message (any thread)
    void report(const std::string& thread_name, const std::string& message);

    /// Check whether any report is waiting
    [[nodiscard]] bool has_crashed() const;

    /// Number of waiting reports
    [[nodiscard]] std::size_t count() const;

    /// Take the oldest report
    [[nodiscard]] std::optional<CrashReport> take();

    /// Take all reports
    [[nodiscard]] std::vector<CrashReport> drain();

    /// Take the oldest report and return it as an error, Ok if none is waiting
    [[nodiscard]] Result<void> check();

private:
    mutable std::mutex m_mutex;
    std::deque<CrashReport> m_reports;
};

} // namespace media_core
