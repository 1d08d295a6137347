#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for media_asset module

#include <cstdint>

namespace media_asset {

// Types
enum class LoadState : std::uint8_t;
enum class SelectionType : std::uint8_t;
struct LoadRequest;
struct LoadPrecedes;
struct LoadProgress;
struct AssetDescriptor;
struct AssetClassInfo;

// Events
struct LoadingAssets;
struct RemoteAssetsToLoad;

// Assets
class LoadDispatcher;
class Asset;
class AssetGroup;

// Built-in kinds
class BytesAsset;
class TextAsset;

// Pipeline
class AssetLoader;
class AssetDiscovery;
struct AssetManagerConfig;
struct ModeInfo;
class ModeAssets;
class AssetManager;

} // namespace media_asset
