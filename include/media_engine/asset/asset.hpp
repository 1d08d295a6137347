#pragma once

/// @file asset.hpp
/// @brief Main include header for media_asset
///
/// media_asset loads externally stored media off the main thread:
/// - Asset: per-asset load/unload state machine
/// - AssetGroup: weighted member selection (sequence, random, forced rotation)
/// - AssetLoader: background decode thread fed by a priority queue
/// - AssetManager: class registration, discovery, progress and boot hold
/// - AssetDiscovery: folder walk and layered per-asset config
/// - BytesAsset / TextAsset: built-in kinds that read whole files
///
/// ## Quick Start
///
/// ```cpp
/// media_core::Clock clock;
/// media_event::EventBus bus;
/// media_core::BootHolds boot;
/// media_core::CrashChannel crashes;
///
/// boot.add_boot_hold(media_asset::AssetManager::BOOT_HOLD);
///
/// media_asset::AssetManager manager(
///     media_asset::AssetManagerConfig{}.with_machine_path("machine"),
///     clock, bus, boot, crashes);
///
/// auto registered = manager.register_asset_class<media_asset::TextAsset>();
/// auto created = manager.create_assets(machine_config);
///
/// bus.subscribe<media_asset::LoadingAssets>([](const media_asset::LoadingAssets& e) {
///     // e.loaded / e.total, e.percent
/// });
///
/// while (!boot.is_boot_complete()) {
///     clock.tick();
///     bus.process();
///     if (auto crashed = crashes.check(); !crashed) break;
/// }
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "base.hpp"
#include "group.hpp"
#include "loader.hpp"
#include "discovery.hpp"
#include "manager.hpp"
#include "kinds.hpp"

namespace media_asset {

/// Prelude - commonly used types
namespace prelude {
    using media_asset::LoadState;
    using media_asset::SelectionType;
    using media_asset::LoadingAssets;
    using media_asset::RemoteAssetsToLoad;
    using media_asset::Asset;
    using media_asset::AssetGroup;
    using media_asset::AssetManager;
    using media_asset::AssetManagerConfig;
    using media_asset::AssetSet;
    using media_asset::ModeAssets;
} // namespace prelude

} // namespace media_asset
