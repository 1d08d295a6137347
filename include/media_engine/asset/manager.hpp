#pragma once

/// @file manager.hpp
/// @brief AssetManager: asset classes, registries, load queue and progress

#include "types.hpp"
#include "base.hpp"
#include "group.hpp"
#include "loader.hpp"
#include "discovery.hpp"

#include <media_engine/core/boot.hpp>
#include <media_engine/core/clock.hpp>
#include <media_engine/core/crash.hpp>
#include <media_engine/core/error.hpp>
#include <media_engine/core/strings.hpp>
#include <media_engine/event/event_bus.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace media_asset {

// =============================================================================
// AssetManagerConfig
// =============================================================================

/// Asset manager configuration
struct AssetManagerConfig {
    std::string machine_path = ".";
    std::chrono::milliseconds loader_timeout{100};
    std::chrono::milliseconds poll_interval{0};  // 0 = every clock tick
    bool start_loader = true;

    /// Builder pattern
    AssetManagerConfig& with_machine_path(std::string path) {
        machine_path = std::move(path);
        return *this;
    }

    AssetManagerConfig& with_loader_timeout(std::chrono::milliseconds timeout) {
        loader_timeout = timeout;
        return *this;
    }

    AssetManagerConfig& with_poll_interval(std::chrono::milliseconds interval) {
        poll_interval = interval;
        return *this;
    }

    /// Keep the loader thread parked until start_loader() is called
    AssetManagerConfig& with_deferred_loader() {
        start_loader = false;
        return *this;
    }

    /// Read `machine_path`, `loader_timeout_ms`, `poll_interval_ms` and
    /// `start_loader`; absent keys keep their defaults
    [[nodiscard]] static media_core::Result<AssetManagerConfig> from_json(const nlohmann::json& j);
};

// =============================================================================
// ModeInfo / ModeAssets
// =============================================================================

/// A mode whose folder and config contribute assets
struct ModeInfo {
    std::string name;
    std::string path;  // Mode folder (root for its asset class folders)
    nlohmann::json config = nlohmann::json::object();
};

/// Assets loaded because a mode started. Unloads exactly that set.
/// Must not outlive the manager that created it.
class ModeAssets {
public:
    ModeAssets() = default;
    ModeAssets(AssetManager& manager, std::string mode_name, AssetSet assets);

    [[nodiscard]] const std::string& mode_name() const noexcept { return m_mode_name; }
    [[nodiscard]] const AssetSet& assets() const noexcept { return m_assets; }
    [[nodiscard]] std::size_t size() const noexcept { return m_assets.size(); }

    /// Check whether unload() has yet to run
    [[nodiscard]] bool is_active() const noexcept { return m_manager != nullptr; }

    /// Unload the set. Later calls do nothing.
    /// @return Number of assets unloaded
    std::size_t unload();

private:
    AssetManager* m_manager = nullptr;
    std::string m_mode_name;
    AssetSet m_assets;
};

// =============================================================================
// AssetManager
// =============================================================================

/// Owns asset class registration, the per-class registries, the load and
/// completion queues, the loader thread and the progress counters.
///
/// Everything except the loader thread runs on the host thread that ticks the
/// clock. Completions are collected by poll(), which the manager schedules on
/// the clock while loads are outstanding.
///
/// Assets, groups, AssetSets and ModeAssets handed out by the manager refer
/// back to it and must not be used once it is destroyed.
class AssetManager : public LoadDispatcher {
public:
    AssetManager(AssetManagerConfig config,
                 media_core::Clock& clock,
                 media_event::EventBus& bus,
                 media_core::BootGate& boot,
                 media_core::CrashChannel& crashes);

    /// Shuts down
    ~AssetManager() override;

    // Non-copyable, non-movable (assets and the loader refer to this)
    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;

    // =========================================================================
    // Asset Classes
    // =========================================================================

    /// Register an asset kind. Fails if the attribute is already registered
    /// or the registration has no factory.
    [[nodiscard]] media_core::Result<void> register_asset_class(AssetClassInfo info);

    /// Register a kind that provides `static AssetClassInfo class_info()` and
    /// a `(AssetDescriptor, LoadDispatcher&)` constructor
    template<typename T>
    [[nodiscard]] media_core::Result<void> register_asset_class() {
        AssetClassInfo info = T::class_info();
        info.factory = [](AssetDescriptor descriptor, LoadDispatcher& dispatcher) -> std::shared_ptr<Asset> {
            return std::make_shared<T>(std::move(descriptor), dispatcher);
        };
        return register_asset_class(std::move(info));
    }

    /// Registered kinds, highest class priority first
    [[nodiscard]] const std::vector<AssetClassInfo>& asset_classes() const noexcept { return m_classes; }

    /// Look up a registered kind by attribute
    [[nodiscard]] const AssetClassInfo* find_asset_class(const std::string& attribute) const;

    // =========================================================================
    // Creation
    // =========================================================================

    /// Discover and create every asset and group, then preload.
    ///
    /// Machine folder first, then each mode folder. Groups of a config are
    /// built right after its assets. Assets whose load key is "preload" are
    /// then loaded; with nothing to preload the "assets" boot hold is
    /// released immediately.
    /// @return Number of assets preloaded
    [[nodiscard]] media_core::Result<std::size_t> create_assets(
        const nlohmann::json& machine_config,
        const std::vector<ModeInfo>& modes = {});

    /// Create one asset through its class factory, replacing any asset of
    /// the same name in that class
    [[nodiscard]] media_core::Result<std::shared_ptr<Asset>> add_asset(
        const std::string& attribute,
        const std::string& name,
        const std::string& file,
        nlohmann::json config = nlohmann::json::object());

    /// Add a group to a class, replacing any group of the same name
    [[nodiscard]] media_core::Result<void> add_group(const std::string& attribute,
                                                     std::shared_ptr<AssetGroup> group);

    /// Resolve a file name on the mode and machine search paths
    [[nodiscard]] media_core::Result<std::string> locate_asset_file(
        const std::string& file_name,
        const std::string& path_string,
        const std::string& path = {}) const {
        return m_discovery.locate_asset_file(file_name, path_string, path);
    }

    // =========================================================================
    // Lookup (names are case-insensitive)
    // =========================================================================

    [[nodiscard]] media_core::Result<std::shared_ptr<Asset>> find_asset(
        const std::string& attribute, const std::string& name) const;

    [[nodiscard]] media_core::Result<std::shared_ptr<AssetGroup>> find_group(
        const std::string& attribute, const std::string& name) const;

    /// All assets of a class, in name order (empty for unknown classes)
    [[nodiscard]] std::vector<std::shared_ptr<Asset>> assets(const std::string& attribute) const;

    /// All groups of a class, in name order
    [[nodiscard]] std::vector<std::shared_ptr<AssetGroup>> groups(const std::string& attribute) const;

    /// Number of assets across all classes
    [[nodiscard]] std::size_t asset_count() const;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Load every asset whose load key equals `key`.
    /// @param priority Overrides each asset's priority when given
    /// @return The assets triggered, for a matching unload_assets() later
    AssetSet load_by_key(const std::string& key, std::optional<int> priority = std::nullopt);

    /// Unload any mix of assets. Assets still loading are logged and skipped.
    /// @return Number of assets unloaded
    std::size_t unload_assets(const AssetSet& assets);

    /// Load the assets keyed "<mode>_start"
    /// @param priority Overrides each asset's priority when given
    [[nodiscard]] ModeAssets on_mode_start(const std::string& mode_name,
                                           std::optional<int> priority = std::nullopt);

    /// Unload what on_mode_start() loaded
    std::size_t on_mode_stop(ModeAssets& mode_assets) { return mode_assets.unload(); }

    /// Count the asset as pending and queue it. Called by Asset::load().
    void enqueue(std::shared_ptr<Asset> asset) override;

    /// Collect finished loads: mark each loaded, count it and post progress.
    /// Resets the local counters and stops polling once all are collected.
    /// @return Number of completions collected
    std::size_t poll();

    /// Start the loader thread when it was deferred by the config
    void start_loader();

    // =========================================================================
    // Progress
    // =========================================================================

    /// Record progress reported by an out-of-process client
    void report_remote_progress(int total, int remaining);

    [[nodiscard]] const LoadProgress& progress() const noexcept { return m_progress; }
    [[nodiscard]] int loading_percent() const noexcept { return m_progress.percent(); }
    [[nodiscard]] int num_assets_remaining() const noexcept { return m_progress.local_remaining(); }

    /// Check whether poll() is scheduled on the clock
    [[nodiscard]] bool is_polling() const noexcept { return m_poll_handle.is_valid(); }

    /// Requests waiting for the loader thread
    [[nodiscard]] std::size_t queued_count() const { return m_load_queue.size(); }

    /// Completions waiting for poll()
    [[nodiscard]] std::size_t completed_count() const { return m_completions.size(); }

    /// Check whether the loader thread died on a decode failure
    [[nodiscard]] bool loader_failed() const noexcept { return m_loader->has_failed(); }

    // =========================================================================
    // Shutdown
    // =========================================================================

    /// Stop the loader thread (blocking) and stop polling. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_shut_down() const noexcept { return m_shut_down; }

    [[nodiscard]] const AssetManagerConfig& config() const noexcept { return m_config; }

    /// Boot hold released when everything requested before boot is loaded
    static constexpr const char* BOOT_HOLD = "assets";

private:
    using AssetMap = std::map<std::string, std::shared_ptr<Asset>, media_core::CaseInsensitiveLess>;
    using GroupMap = std::map<std::string, std::shared_ptr<AssetGroup>, media_core::CaseInsensitiveLess>;

    struct ClassRegistry {
        AssetMap assets;
        GroupMap groups;
        nlohmann::json defaults = nlohmann::json::object();
    };

    media_core::Result<void> create_from_disk(const nlohmann::json& config,
                                              const std::string& root,
                                              const std::string& mode_name);
    media_core::Result<void> create_groups(const nlohmann::json& config);

    void post_progress();
    void release_boot_hold();
    void arm_poll();
    void disarm_poll();

    AssetManagerConfig m_config;
    media_core::Clock& m_clock;
    media_event::EventBus& m_bus;
    media_core::BootGate& m_boot;
    media_core::CrashChannel& m_crashes;

    AssetDiscovery m_discovery;
    std::vector<AssetClassInfo> m_classes;
    std::map<std::string, ClassRegistry, media_core::CaseInsensitiveLess> m_registries;

    LoadQueue m_load_queue;
    CompletionQueue m_completions;
    std::unique_ptr<AssetLoader> m_loader;

    LoadProgress m_progress;
    media_core::ScheduleHandle m_poll_handle;
    media_event::SubscriberId m_remote_subscription;
    bool m_boot_hold_released = false;
    bool m_shut_down = false;
};

} // namespace media_asset
