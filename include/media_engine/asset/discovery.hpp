#pragma once

/// @file discovery.hpp
/// @brief Finds asset files on disk and builds their merged configs
///
/// For each registered asset class, files under `<root>/<path_string>` with a
/// registered extension become assets. An asset's config is built in layers:
///
/// 1. `assets:<config_section>:default` from the machine config
/// 2. `assets:<config_section>:<folder>` when the file sits in a folder that
///    has its own defaults section
/// 3. the asset's own entry in the config section, matched by asset name or
///    by its `file` setting
///
/// The result always carries `file` (absolute path) and `load`. A load key of
/// `mode_start` becomes `<mode>_start`.

#include "types.hpp"
#include <media_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace media_asset {

// =============================================================================
// AssetDiscovery
// =============================================================================

class AssetDiscovery {
public:
    /// @param machine_path Machine root, searched last by locate_asset_file()
    explicit AssetDiscovery(std::string machine_path);

    [[nodiscard]] const std::string& machine_path() const noexcept { return m_machine_path; }

    /// Build the per-folder default configs for an asset class.
    /// @return Object with a "default" entry plus one entry per folder section,
    ///         each folder entry being "default" updated with its own keys
    [[nodiscard]] static media_core::Result<nlohmann::json> build_defaults(
        const AssetClassInfo& info,
        const nlohmann::json& machine_config);

    /// Walk `<root>/<path_string>` (following symlinks) and build the config
    /// of every asset found, plus every configured asset whose `file` is
    /// found by locate_asset_file().
    /// @param defaults Output of build_defaults() for this class
    /// @param section_config The class's config section, may be null
    /// @param root Machine or mode folder
    /// @param mode_name Empty for machine-wide assets
    /// @return Object of asset name -> merged config
    [[nodiscard]] media_core::Result<nlohmann::json> discover(
        const AssetClassInfo& info,
        const nlohmann::json& defaults,
        const nlohmann::json& section_config,
        const std::string& root,
        const std::string& mode_name = {}) const;

    /// Resolve `<path>/<path_string>/<file_name>`, falling back to the
    /// machine root when `path` is empty or the file is not there.
    [[nodiscard]] media_core::Result<std::string> locate_asset_file(
        const std::string& file_name,
        const std::string& path_string,
        const std::string& path = {}) const;

private:
    [[nodiscard]] static media_core::Result<void> finish_config(
        nlohmann::json& config,
        const std::string& asset_name,
        const std::string& full_path,
        const std::string& mode_name);

    std::string m_machine_path;
};

} // namespace media_asset
