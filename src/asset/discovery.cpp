/// @file discovery.cpp
/// @brief AssetDiscovery implementation

#include <media_engine/asset/discovery.hpp>
#include <media_engine/core/config.hpp>
#include <media_engine/core/log.hpp>
#include <media_engine/core/strings.hpp>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace media_asset {

namespace {

std::string absolute_path(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

} // anonymous namespace

AssetDiscovery::AssetDiscovery(std::string machine_path)
    : m_machine_path(std::move(machine_path)) {}

// =============================================================================
// Defaults
// =============================================================================

media_core::Result<nlohmann::json> AssetDiscovery::build_defaults(
    const AssetClassInfo& info,
    const nlohmann::json& machine_config) {

    nlohmann::json defaults = nlohmann::json::object();
    defaults["default"] = nlohmann::json::object();

    if (!machine_config.is_object()) {
        return media_core::Ok(std::move(defaults));
    }
    auto assets = machine_config.find("assets");
    if (assets == machine_config.end() || !assets->is_object()) {
        return media_core::Ok(std::move(defaults));
    }
    auto section = assets->find(info.config_section);
    if (section == assets->end() || section->is_null()) {
        return media_core::Ok(std::move(defaults));
    }
    if (!section->is_object()) {
        return media_core::Err<nlohmann::json>(
            media_core::ConfigError::invalid_value("assets", info.config_section, "expected a mapping"));
    }

    // Every folder section starts from "default", so read it first
    auto base = section->find("default");
    if (base != section->end()) {
        if (!base->is_object()) {
            return media_core::Err<nlohmann::json>(
                media_core::ConfigError::invalid_value(info.config_section, "default", "expected a mapping"));
        }
        defaults["default"] = *base;
    }

    for (const auto& [folder, settings] : section->items()) {
        if (folder == "default") {
            continue;
        }
        if (!settings.is_object()) {
            return media_core::Err<nlohmann::json>(
                media_core::ConfigError::invalid_value(info.config_section, folder, "expected a mapping"));
        }
        nlohmann::json merged = defaults["default"];
        media_core::merge_json(merged, settings);
        defaults[folder] = std::move(merged);
    }

    return media_core::Ok(std::move(defaults));
}

// =============================================================================
// Discovery
// =============================================================================

media_core::Result<nlohmann::json> AssetDiscovery::discover(
    const AssetClassInfo& info,
    const nlohmann::json& defaults,
    const nlohmann::json& section_config,
    const std::string& root,
    const std::string& mode_name) const {

    auto log = media_core::asset_logger();
    const std::string& base_root = root.empty() ? m_machine_path : root;
    const nlohmann::json& entries = section_config.is_object() ? section_config : nlohmann::json::object();

    auto defaults_for = [&defaults](const std::string& key) -> nlohmann::json {
        auto it = defaults.find(key);
        if (it != defaults.end() && it->is_object()) {
            return *it;
        }
        return nlohmann::json::object();
    };

    // Collect matching files first; directory iteration order is unspecified
    std::vector<fs::path> files;
    fs::path base = fs::path(base_root) / info.path_string;
    std::error_code ec;
    if (fs::is_directory(base, ec)) {
        auto options = fs::directory_options::follow_directory_symlink |
                       fs::directory_options::skip_permission_denied;
        for (fs::recursive_directory_iterator it(base, options, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && info.matches_extension(it->path().filename().string())) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            return media_core::Err<nlohmann::json>(media_core::Error(media_core::ErrorCode::IOError,
                "Failed to scan '" + base.string() + "': " + ec.message()));
        }
    } else {
        log->debug("No '{}' folder under '{}'", info.path_string, base_root);
    }
    std::sort(files.begin(), files.end());

    nlohmann::json found = nlohmann::json::object();

    for (const auto& path : files) {
        const std::string file_name = path.filename().string();
        const std::string folder = path.parent_path().filename().string();
        std::string name = media_core::to_lower(path.stem().string());

        const bool use_default = folder == info.path_string || !defaults.contains(folder);
        nlohmann::json config = defaults_for(use_default ? "default" : folder);

        for (const auto& [key, entry] : entries.items()) {
            if (!entry.is_object()) {
                continue;
            }
            auto file = entry.find("file");
            bool file_matches = file != entry.end() && file->is_string() && file->get<std::string>() == file_name;
            if (file_matches || media_core::iequals(name, key)) {
                name = key;
                media_core::merge_json(config, entry);
                break;
            }
        }

        auto finished = finish_config(config, name, absolute_path(path), mode_name);
        if (!finished) {
            return media_core::Err<nlohmann::json>(std::move(finished.error()));
        }

        log->trace("Found {} asset '{}' at '{}'", info.attribute, name, path.string());
        found[name] = std::move(config);
    }

    // Configured assets whose file lives somewhere else on the search path
    for (const auto& [key, entry] : entries.items()) {
        if (found.contains(key)) {
            continue;
        }
        if (!entry.is_object()) {
            return media_core::Err<nlohmann::json>(
                media_core::ConfigError::invalid_value(info.config_section, key, "expected a mapping"));
        }

        auto file_name = media_core::json_value_or<std::string>(entry, "file", "");
        if (file_name.empty()) {
            return media_core::Err<nlohmann::json>(media_core::ConfigError::missing_key(key, "file"));
        }

        auto located = locate_asset_file(file_name, info.path_string, root);
        if (!located) {
            return media_core::Err<nlohmann::json>(std::move(located.error()));
        }

        nlohmann::json config = defaults_for("default");
        media_core::merge_json(config, entry);

        auto finished = finish_config(config, key, *located, mode_name);
        if (!finished) {
            return media_core::Err<nlohmann::json>(std::move(finished.error()));
        }
        found[key] = std::move(config);
    }

    return media_core::Ok(std::move(found));
}

media_core::Result<void> AssetDiscovery::finish_config(
    nlohmann::json& config,
    const std::string& asset_name,
    const std::string& full_path,
    const std::string& mode_name) {

    config["file"] = full_path;

    auto load = config.find("load");
    if (load == config.end() || !load->is_string()) {
        return media_core::Err(media_core::ConfigError::missing_key(asset_name, "load"));
    }

    if (load->get<std::string>() == load_keys::MODE_START) {
        if (mode_name.empty()) {
            return media_core::Err(media_core::ConfigError::invalid_value(
                asset_name, "load", "mode_start is only valid for mode assets"));
        }
        *load = load_keys::mode_start(mode_name);
    }

    return media_core::Ok();
}

// =============================================================================
// File lookup
// =============================================================================

media_core::Result<std::string> AssetDiscovery::locate_asset_file(
    const std::string& file_name,
    const std::string& path_string,
    const std::string& path) const {

    std::vector<std::string> search;
    if (!path.empty()) {
        search.push_back(path);
    }
    search.push_back(m_machine_path);

    for (const auto& root : search) {
        fs::path candidate = fs::path(root) / path_string / file_name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return media_core::Ok(absolute_path(candidate));
        }
    }

    return media_core::Err<std::string>(media_core::LookupError::file_not_found(file_name));
}

} // namespace media_asset
