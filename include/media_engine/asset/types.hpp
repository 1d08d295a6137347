#pragma once

/// @file types.hpp
/// @brief Core types for media_asset module

#include "fwd.hpp"
#include <media_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace media_asset {

// =============================================================================
// LoadState
// =============================================================================

/// Asset loading state. Unloading is tracked separately as a transient flag.
enum class LoadState : std::uint8_t {
    Unloaded,  // Not in memory
    Loading,   // Queued or being decoded
    Loaded,    // Decoded and ready to use
};

/// Get load state name
[[nodiscard]] inline const char* load_state_name(LoadState state) {
    switch (state) {
        case LoadState::Unloaded: return "Unloaded";
        case LoadState::Loading: return "Loading";
        case LoadState::Loaded: return "Loaded";
        default: return "Unknown";
    }
}

// =============================================================================
// SelectionType
// =============================================================================

/// How an AssetGroup picks a member
enum class SelectionType : std::uint8_t {
    Sequence,         // Rotate through members, each repeated by weight
    Random,           // Weighted random with replacement
    RandomForceNext,  // Weighted random, never the previous pick
    RandomForceAll,   // Weighted random, every member once per cycle
};

/// Get selection type config name
[[nodiscard]] inline const char* selection_type_name(SelectionType type) {
    switch (type) {
        case SelectionType::Sequence: return "sequence";
        case SelectionType::Random: return "random";
        case SelectionType::RandomForceNext: return "random_force_next";
        case SelectionType::RandomForceAll: return "random_force_all";
        default: return "unknown";
    }
}

/// Parse a selection type config name (case-insensitive)
[[nodiscard]] std::optional<SelectionType> parse_selection_type(std::string_view name);

// =============================================================================
// Load keys
// =============================================================================

namespace load_keys {

/// Loaded once every asset has been created at boot
inline constexpr const char* PRELOAD = "preload";
/// Loaded only when something asks for it
inline constexpr const char* ON_DEMAND = "on_demand";
/// Placeholder rewritten to "<mode>_start" during discovery
inline constexpr const char* MODE_START = "mode_start";

/// Load key for assets that load when `mode_name` starts
[[nodiscard]] inline std::string mode_start(const std::string& mode_name) {
    return mode_name + "_start";
}

} // namespace load_keys

// =============================================================================
// LoadRequest
// =============================================================================

/// Entry in the loader's priority queue.
/// The priority is captured at enqueue time, so changing an asset's priority
/// later never reorders entries that are already queued.
struct LoadRequest {
    std::shared_ptr<Asset> asset;
    int priority = 0;
    std::uint64_t creation_id = 0;
};

/// Strict ordering of load requests: higher priority first, then the asset
/// created first. Only two requests for the same asset at the same priority
/// are unordered.
[[nodiscard]] inline bool load_precedes(const LoadRequest& a, const LoadRequest& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.creation_id < b.creation_id;
}

/// Function object form of load_precedes for queue templates
struct LoadPrecedes {
    bool operator()(const LoadRequest& a, const LoadRequest& b) const noexcept {
        return load_precedes(a, b);
    }
};

// =============================================================================
// Events
// =============================================================================

/// Posted after every completion and every remote progress update
struct LoadingAssets {
    int total = 0;
    int loaded = 0;
    int remaining = 0;
    int percent = 100;
};

/// Load progress self-reported by an out-of-process client
struct RemoteAssetsToLoad {
    int total = 0;
    int remaining = 0;
};

// =============================================================================
// LoadProgress
// =============================================================================

/// Load bookkeeping owned by one AssetManager.
/// Local counters go back to zero whenever loaded catches up with pending.
struct LoadProgress {
    int pending = 0;           // Local loads requested since the last reset
    int loaded = 0;            // Local loads completed since the last reset
    int remote_total = 0;      // Remote client's total
    int remote_loaded = 0;     // Remote client's total - remaining
    int remote_remaining = 0;  // Remote client's remaining

    [[nodiscard]] int total() const noexcept { return pending + remote_total; }

    [[nodiscard]] int loaded_total() const noexcept { return loaded + remote_loaded; }

    [[nodiscard]] int remaining() const noexcept { return total() - loaded_total(); }

    [[nodiscard]] int local_remaining() const noexcept { return pending - loaded; }

    /// Rounded percentage (round half to even), 100 when nothing is tracked
    [[nodiscard]] int percent() const noexcept {
        int denominator = total();
        if (denominator == 0) {
            return 100;
        }
        double ratio = static_cast<double>(loaded_total()) / static_cast<double>(denominator);
        return static_cast<int>(std::nearbyint(ratio * 100.0));
    }

    /// Snapshot as a bus event
    [[nodiscard]] LoadingAssets to_event() const noexcept {
        return LoadingAssets{total(), loaded_total(), remaining(), percent()};
    }
};

// =============================================================================
// AssetDescriptor
// =============================================================================

/// Everything needed to construct an asset instance
struct AssetDescriptor {
    std::string name;
    std::string class_id;  // Attribute of the owning asset class
    std::string file;      // Absolute path
    nlohmann::json config = nlohmann::json::object();
};

// =============================================================================
// AssetClassInfo
// =============================================================================

/// Creates an asset of one kind
using AssetFactory = std::function<std::shared_ptr<Asset>(AssetDescriptor, LoadDispatcher&)>;

/// Registration record for one asset kind
struct AssetClassInfo {
    std::string attribute;              // Registry key, e.g. "images"
    std::string config_section;         // Per-asset config section, e.g. "images"
    std::string path_string;            // Folder under the machine/mode root
    std::vector<std::string> extensions;  // Without dots
    int priority = 0;                   // Higher registers, creates and loads first
    std::string group_config_section;   // Empty when the kind has no groups
    AssetFactory factory;

    /// Builder pattern
    AssetClassInfo& with_extensions(std::vector<std::string> exts) {
        extensions = std::move(exts);
        return *this;
    }

    AssetClassInfo& with_priority(int p) {
        priority = p;
        return *this;
    }

    AssetClassInfo& with_group_section(std::string section) {
        group_config_section = std::move(section);
        return *this;
    }

    AssetClassInfo& with_factory(AssetFactory f) {
        factory = std::move(f);
        return *this;
    }

    /// Check whether a file name carries one of this kind's extensions
    [[nodiscard]] bool matches_extension(const std::string& file_name) const;
};

// =============================================================================
// AssetSet
// =============================================================================

/// A set of assets triggered together, e.g. by one load key
using AssetSet = std::set<std::shared_ptr<Asset>>;

} // namespace media_asset
