/// @file manager.cpp
/// @brief AssetManager implementation

#include <media_engine/asset/manager.hpp>
#include <media_engine/core/config.hpp>
#include <media_engine/core/log.hpp>

#include <algorithm>
#include <utility>

namespace media_asset {

// =============================================================================
// AssetManagerConfig
// =============================================================================

media_core::Result<AssetManagerConfig> AssetManagerConfig::from_json(const nlohmann::json& j) {
    AssetManagerConfig config;
    if (j.is_null()) {
        return media_core::Ok(std::move(config));
    }
    if (!j.is_object()) {
        return media_core::Err<AssetManagerConfig>(
            media_core::ConfigError::invalid_value("asset_manager", "", "expected a mapping"));
    }

    try {
        if (j.contains("machine_path")) {
            config.machine_path = j.at("machine_path").get<std::string>();
        }
        if (j.contains("loader_timeout_ms")) {
            auto ms = j.at("loader_timeout_ms").get<int>();
            if (ms <= 0) {
                return media_core::Err<AssetManagerConfig>(media_core::ConfigError::invalid_value(
                    "asset_manager", "loader_timeout_ms", "must be positive"));
            }
            config.loader_timeout = std::chrono::milliseconds(ms);
        }
        if (j.contains("poll_interval_ms")) {
            auto ms = j.at("poll_interval_ms").get<int>();
            if (ms < 0) {
                return media_core::Err<AssetManagerConfig>(media_core::ConfigError::invalid_value(
                    "asset_manager", "poll_interval_ms", "must not be negative"));
            }
            config.poll_interval = std::chrono::milliseconds(ms);
        }
        if (j.contains("start_loader")) {
            config.start_loader = j.at("start_loader").get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        return media_core::Err<AssetManagerConfig>(
            media_core::ConfigError::invalid_value("asset_manager", "", e.what()));
    }

    return media_core::Ok(std::move(config));
}

// =============================================================================
// ModeAssets
// =============================================================================

ModeAssets::ModeAssets(AssetManager& manager, std::string mode_name, AssetSet assets)
    : m_manager(&manager)
    , m_mode_name(std::move(mode_name))
    , m_assets(std::move(assets)) {}

std::size_t ModeAssets::unload() {
    if (!m_manager) {
        return 0;
    }
    auto* manager = std::exchange(m_manager, nullptr);
    return manager->unload_assets(m_assets);
}

// =============================================================================
// Construction
// =============================================================================

AssetManager::AssetManager(AssetManagerConfig config,
                           media_core::Clock& clock,
                           media_event::EventBus& bus,
                           media_core::BootGate& boot,
                           media_core::CrashChannel& crashes)
    : m_config(std::move(config))
    , m_clock(clock)
    , m_bus(bus)
    , m_boot(boot)
    , m_crashes(crashes)
    , m_discovery(m_config.machine_path) {

    m_loader = std::make_unique<AssetLoader>(m_load_queue, m_completions, m_crashes, m_config.loader_timeout);
    if (m_config.start_loader) {
        m_loader->start();
    }

    m_remote_subscription = m_bus.subscribe<RemoteAssetsToLoad>([this](const RemoteAssetsToLoad& e) {
        report_remote_progress(e.total, e.remaining);
    });
}

AssetManager::~AssetManager() {
    shutdown();
}

void AssetManager::start_loader() {
    m_loader->start();
}

// =============================================================================
// Asset Classes
// =============================================================================

media_core::Result<void> AssetManager::register_asset_class(AssetClassInfo info) {
    if (m_registries.count(info.attribute) > 0) {
        return media_core::Err(media_core::ConfigError::duplicate_attribute(info.attribute));
    }
    if (!info.factory) {
        return media_core::Err(media_core::ConfigError::invalid_value(info.attribute, "factory", "no factory"));
    }

    media_core::asset_logger()->debug("Registered asset class '{}' (priority {})", info.attribute, info.priority);

    m_registries.emplace(info.attribute, ClassRegistry{});
    m_classes.push_back(std::move(info));
    std::stable_sort(m_classes.begin(), m_classes.end(),
        [](const AssetClassInfo& a, const AssetClassInfo& b) { return a.priority > b.priority; });

    return media_core::Ok();
}

const AssetClassInfo* AssetManager::find_asset_class(const std::string& attribute) const {
    for (const auto& info : m_classes) {
        if (media_core::iequals(info.attribute, attribute)) {
            return &info;
        }
    }
    return nullptr;
}

// =============================================================================
// Creation
// =============================================================================

media_core::Result<std::size_t> AssetManager::create_assets(
    const nlohmann::json& machine_config,
    const std::vector<ModeInfo>& modes) {

    auto log = media_core::asset_logger();

    for (const auto& info : m_classes) {
        auto defaults = AssetDiscovery::build_defaults(info, machine_config);
        if (!defaults) {
            return media_core::Err<std::size_t>(std::move(defaults.error()));
        }
        m_registries[info.attribute].defaults = std::move(*defaults);
    }

    auto machine = create_from_disk(machine_config, m_config.machine_path, {});
    if (!machine) {
        return media_core::Err<std::size_t>(std::move(machine.error()));
    }
    auto machine_groups = create_groups(machine_config);
    if (!machine_groups) {
        return media_core::Err<std::size_t>(std::move(machine_groups.error()));
    }

    for (const auto& mode : modes) {
        auto created = create_from_disk(mode.config, mode.path, mode.name);
        if (!created) {
            return media_core::Err<std::size_t>(std::move(created.error().with_context("mode", mode.name)));
        }
        auto mode_groups = create_groups(mode.config);
        if (!mode_groups) {
            return media_core::Err<std::size_t>(std::move(mode_groups.error().with_context("mode", mode.name)));
        }
    }

    log->info("Created {} assets in {} classes", asset_count(), m_classes.size());

    // Collect first so preload order follows class priority
    std::vector<std::shared_ptr<Asset>> preload;
    for (const auto& info : m_classes) {
        for (const auto& [name, asset] : m_registries[info.attribute].assets) {
            if (asset->load_key() == load_keys::PRELOAD) {
                preload.push_back(asset);
            }
        }
    }

    for (const auto& asset : preload) {
        asset->load();
    }

    if (preload.empty()) {
        release_boot_hold();
    } else {
        log->info("Preloading {} assets", preload.size());
    }

    return media_core::Ok(preload.size());
}

media_core::Result<void> AssetManager::create_from_disk(const nlohmann::json& config,
                                                        const std::string& root,
                                                        const std::string& mode_name) {
    for (const auto& info : m_classes) {
        nlohmann::json section = nlohmann::json::object();
        if (config.is_object()) {
            auto it = config.find(info.config_section);
            if (it != config.end() && !it->is_null()) {
                section = *it;
            }
        }

        auto found = m_discovery.discover(info, m_registries[info.attribute].defaults, section, root, mode_name);
        if (!found) {
            return media_core::Err(std::move(found.error()));
        }

        for (const auto& [name, asset_config] : found->items()) {
            auto file = asset_config.at("file").get<std::string>();
            auto added = add_asset(info.attribute, name, file, asset_config);
            if (!added) {
                return media_core::Err(std::move(added.error()));
            }
        }
    }
    return media_core::Ok();
}

media_core::Result<void> AssetManager::create_groups(const nlohmann::json& config) {
    if (!config.is_object()) {
        return media_core::Ok();
    }

    for (const auto& info : m_classes) {
        if (info.group_config_section.empty()) {
            continue;
        }
        auto section = config.find(info.group_config_section);
        if (section == config.end() || !section->is_object()) {
            continue;
        }

        const auto& registry = m_registries[info.attribute];
        auto lookup = [&registry](const std::string& name) -> std::shared_ptr<Asset> {
            auto it = registry.assets.find(name);
            return it != registry.assets.end() ? it->second : nullptr;
        };

        for (const auto& [name, settings] : section->items()) {
            auto group = AssetGroup::from_config(name, settings, info.config_section, lookup);
            if (!group) {
                return media_core::Err(std::move(group.error()));
            }
            auto added = add_group(info.attribute, std::move(*group));
            if (!added) {
                return added;
            }
        }
    }
    return media_core::Ok();
}

media_core::Result<std::shared_ptr<Asset>> AssetManager::add_asset(
    const std::string& attribute,
    const std::string& name,
    const std::string& file,
    nlohmann::json config) {

    const AssetClassInfo* info = find_asset_class(attribute);
    if (!info) {
        return media_core::Err<std::shared_ptr<Asset>>(media_core::LookupError::class_not_found(attribute));
    }

    AssetDescriptor descriptor{name, info->attribute, file, std::move(config)};
    auto asset = info->factory(std::move(descriptor), *this);
    if (!asset) {
        return media_core::Err<std::shared_ptr<Asset>>(
            media_core::ConfigError::invalid_value(attribute, name, "factory returned no asset"));
    }

    m_registries[info->attribute].assets[name] = asset;
    return media_core::Ok(std::move(asset));
}

media_core::Result<void> AssetManager::add_group(const std::string& attribute,
                                                 std::shared_ptr<AssetGroup> group) {
    auto it = m_registries.find(attribute);
    if (it == m_registries.end()) {
        return media_core::Err(media_core::LookupError::class_not_found(attribute));
    }
    if (!group) {
        return media_core::Err(media_core::ConfigError::invalid_value(attribute, "group", "null group"));
    }

    media_core::asset_logger()->debug("Created {} group '{}' with {} members",
        attribute, group->name(), group->size());
    auto name = group->name();
    it->second.groups[name] = std::move(group);
    return media_core::Ok();
}

// =============================================================================
// Lookup
// =============================================================================

media_core::Result<std::shared_ptr<Asset>> AssetManager::find_asset(
    const std::string& attribute, const std::string& name) const {
    auto registry = m_registries.find(attribute);
    if (registry == m_registries.end()) {
        return media_core::Err<std::shared_ptr<Asset>>(media_core::LookupError::class_not_found(attribute));
    }
    auto it = registry->second.assets.find(name);
    if (it == registry->second.assets.end()) {
        return media_core::Err<std::shared_ptr<Asset>>(media_core::LookupError::asset_not_found(attribute, name));
    }
    return media_core::Ok(it->second);
}

media_core::Result<std::shared_ptr<AssetGroup>> AssetManager::find_group(
    const std::string& attribute, const std::string& name) const {
    auto registry = m_registries.find(attribute);
    if (registry == m_registries.end()) {
        return media_core::Err<std::shared_ptr<AssetGroup>>(media_core::LookupError::class_not_found(attribute));
    }
    auto it = registry->second.groups.find(name);
    if (it == registry->second.groups.end()) {
        return media_core::Err<std::shared_ptr<AssetGroup>>(
            media_core::LookupError::asset_not_found(attribute, name));
    }
    return media_core::Ok(it->second);
}

std::vector<std::shared_ptr<Asset>> AssetManager::assets(const std::string& attribute) const {
    std::vector<std::shared_ptr<Asset>> out;
    auto registry = m_registries.find(attribute);
    if (registry != m_registries.end()) {
        for (const auto& [name, asset] : registry->second.assets) {
            out.push_back(asset);
        }
    }
    return out;
}

std::vector<std::shared_ptr<AssetGroup>> AssetManager::groups(const std::string& attribute) const {
    std::vector<std::shared_ptr<AssetGroup>> out;
    auto registry = m_registries.find(attribute);
    if (registry != m_registries.end()) {
        for (const auto& [name, group] : registry->second.groups) {
            out.push_back(group);
        }
    }
    return out;
}

std::size_t AssetManager::asset_count() const {
    std::size_t count = 0;
    for (const auto& [attribute, registry] : m_registries) {
        count += registry.assets.size();
    }
    return count;
}

// =============================================================================
// Loading
// =============================================================================

AssetSet AssetManager::load_by_key(const std::string& key, std::optional<int> priority) {
    AssetSet triggered;
    for (const auto& info : m_classes) {
        for (const auto& [name, asset] : m_registries[info.attribute].assets) {
            if (asset->load_key() == key) {
                asset->load({}, priority);
                triggered.insert(asset);
            }
        }
    }

    media_core::asset_logger()->debug("Load key '{}' triggered {} assets", key, triggered.size());
    return triggered;
}

std::size_t AssetManager::unload_assets(const AssetSet& assets) {
    std::size_t count = 0;
    for (const auto& asset : assets) {
        auto result = asset->unload();
        if (!result) {
            media_core::asset_logger()->warn("{}", result.error().message());
            continue;
        }
        ++count;
    }
    return count;
}

ModeAssets AssetManager::on_mode_start(const std::string& mode_name, std::optional<int> priority) {
    return ModeAssets(*this, mode_name, load_by_key(load_keys::mode_start(mode_name), priority));
}

void AssetManager::enqueue(std::shared_ptr<Asset> asset) {
    if (m_shut_down) {
        media_core::asset_logger()->warn("Load of '{}' requested after shutdown, ignored", asset->name());
        return;
    }

    ++m_progress.pending;
    LoadRequest request{asset, asset->priority(), asset->creation_id()};
    m_load_queue.push(std::move(request));
    arm_poll();
}

std::size_t AssetManager::poll() {
    std::size_t collected = 0;

    while (auto asset = m_completions.try_pop()) {
        (*asset)->mark_loaded();
        ++m_progress.loaded;
        ++collected;
        post_progress();
    }

    if (m_progress.loaded == m_progress.pending) {
        if (m_progress.pending > 0) {
            media_core::asset_logger()->info("Loaded {} assets", m_progress.pending);
        }
        m_progress.pending = 0;
        m_progress.loaded = 0;
        disarm_poll();
    }

    return collected;
}

// =============================================================================
// Progress
// =============================================================================

void AssetManager::report_remote_progress(int total, int remaining) {
    if (total < 0 || remaining < 0 || remaining > total) {
        media_core::asset_logger()->warn("Ignoring remote progress total={} remaining={}", total, remaining);
        return;
    }

    m_progress.remote_total = total;
    m_progress.remote_remaining = remaining;
    m_progress.remote_loaded = total - remaining;
    post_progress();
}

void AssetManager::post_progress() {
    LoadingAssets event = m_progress.to_event();
    m_bus.publish(event);

    media_core::asset_logger()->debug("Loading assets: {}/{} ({}%)", event.loaded, event.total, event.percent);

    if (event.remaining == 0 && !m_boot.is_boot_complete()) {
        release_boot_hold();
    }
}

void AssetManager::release_boot_hold() {
    if (m_boot_hold_released) {
        return;
    }
    m_boot_hold_released = true;
    m_boot.clear_boot_hold(BOOT_HOLD);
}

void AssetManager::arm_poll() {
    if (m_poll_handle.is_valid()) {
        return;
    }
    m_poll_handle = m_clock.schedule_interval([this]() { poll(); }, m_config.poll_interval);
}

void AssetManager::disarm_poll() {
    if (!m_poll_handle.is_valid()) {
        return;
    }
    m_clock.unschedule(m_poll_handle);
    m_poll_handle = media_core::ScheduleHandle{};
}

// =============================================================================
// Shutdown
// =============================================================================

void AssetManager::shutdown() {
    if (m_shut_down) {
        return;
    }
    m_shut_down = true;

    m_bus.unsubscribe(m_remote_subscription);
    disarm_poll();
    m_loader->stop();

    media_core::asset_logger()->info("Asset manager shut down");
}

} // namespace media_asset
