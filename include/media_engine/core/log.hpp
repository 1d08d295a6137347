#pragma once

/// @file log.hpp
/// @brief Logging utilities for media_engine

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>

namespace media_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for the asset manager, groups and discovery
std::shared_ptr<spdlog::logger> asset_logger();

/// Logger for the background loader thread
std::shared_ptr<spdlog::logger> loader_logger();

/// Logger for the event bus and boot holds
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every logger
void shutdown_logging();

} // namespace media_core
