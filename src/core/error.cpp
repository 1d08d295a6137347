/// @file error.cpp
/// @brief Error handling implementation for media_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <media_engine/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace media_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.section.empty()) {
        oss << " (section: " << err.section << ")";
    }
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

std::string format_lookup_error(const LookupError& err) {
    std::ostringstream oss;
    oss << "[LookupError] " << err.message;
    return oss.str();
}

std::string format_state_error(const StateError& err) {
    std::ostringstream oss;
    oss << "[StateError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, LookupError>) {
            oss << detail::format_lookup_error(err);
        } else if constexpr (std::is_same_v<T, StateError>) {
            oss << detail::format_state_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> lookup_errors{0};
    std::atomic<std::uint64_t> state_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<LookupError>()) {
        s_error_stats.lookup_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<StateError>()) {
        s_error_stats.state_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.lookup_errors.store(0, std::memory_order_relaxed);
    s_error_stats.state_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Lookup: " << s_error_stats.lookup_errors.load() << "\n"
        << "  State: " << s_error_stats.state_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace media_core
