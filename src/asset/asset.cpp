/// @file asset.cpp
/// @brief Asset state machine and shared media_asset type helpers

#include <media_engine/asset/base.hpp>
#include <media_engine/core/log.hpp>
#include <media_engine/core/strings.hpp>

#include <algorithm>
#include <utility>

namespace media_asset {

// =============================================================================
// Type helpers
// =============================================================================

std::optional<SelectionType> parse_selection_type(std::string_view name) {
    const std::string lower = media_core::to_lower(media_core::trim(name));
    if (lower == "sequence") return SelectionType::Sequence;
    if (lower == "random") return SelectionType::Random;
    if (lower == "random_force_next") return SelectionType::RandomForceNext;
    if (lower == "random_force_all") return SelectionType::RandomForceAll;
    return std::nullopt;
}

bool AssetClassInfo::matches_extension(const std::string& file_name) const {
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return false;
    }
    std::string_view ext(file_name.data() + dot + 1, file_name.size() - dot - 1);
    return std::any_of(extensions.begin(), extensions.end(),
        [ext](const std::string& candidate) { return media_core::iequals(candidate, ext); });
}

// =============================================================================
// Asset
// =============================================================================

std::uint64_t Asset::next_creation_id() noexcept {
    static std::atomic<std::uint64_t> s_next_id{1};
    return s_next_id.fetch_add(1, std::memory_order_relaxed);
}

Asset::Asset(AssetDescriptor descriptor, LoadDispatcher& dispatcher)
    : m_name(std::move(descriptor.name))
    , m_class_id(std::move(descriptor.class_id))
    , m_file(std::move(descriptor.file))
    , m_config(std::move(descriptor.config))
    , m_creation_id(next_creation_id())
    , m_priority(0)
    , m_dispatcher(dispatcher) {
    if (!m_config.is_object()) {
        m_config = nlohmann::json::object();
    }
    auto it = m_config.find("priority");
    if (it != m_config.end() && it->is_number_integer()) {
        m_priority = it->get<int>();
    }
}

std::string Asset::load_key() const {
    auto it = m_config.find("load");
    if (it != m_config.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return load_keys::ON_DEMAND;
}

void Asset::load(Callback callback, std::optional<int> priority, const void* owner) {
    if (priority) {
        m_priority = *priority;
    }

    if (callback) {
        bool duplicate = owner != nullptr &&
            std::any_of(m_callbacks.begin(), m_callbacks.end(),
                [owner](const CallbackEntry& entry) { return entry.owner == owner; });
        if (!duplicate) {
            m_callbacks.push_back(CallbackEntry{std::move(callback), owner});
        }
    }

    if (is_loaded()) {
        fire_callbacks();
        return;
    }

    if (is_unloading()) {
        // do_unload() asked for the asset again; the request is queued after it
        media_core::asset_logger()->debug("Asset '{}' requested while unloading", m_name);
    }

    m_state.store(LoadState::Loading, std::memory_order_release);
    m_dispatcher.enqueue(shared_from_this());
}

media_core::Result<void> Asset::unload() {
    if (is_loading()) {
        return media_core::Err(media_core::StateError::load_in_progress(m_name));
    }

    m_unloading.store(true, std::memory_order_release);
    m_state.store(LoadState::Unloaded, std::memory_order_release);
    {
        std::lock_guard lock(m_decode_mutex);
        do_unload();
        m_decoded = false;
    }
    m_unloading.store(false, std::memory_order_release);

    media_core::asset_logger()->trace("Unloaded asset '{}'", m_name);
    return media_core::Ok();
}

bool Asset::mark_loaded() {
    if (!is_loading()) {
        return false;
    }
    {
        // A duplicate queue entry can complete after an unload and a fresh
        // request; that request's own completion is still on its way.
        std::lock_guard lock(m_decode_mutex);
        if (!m_decoded) {
            return false;
        }
    }

    m_state.store(LoadState::Loaded, std::memory_order_release);
    m_unloading.store(false, std::memory_order_release);
    fire_callbacks();
    return true;
}

media_core::Result<bool> Asset::decode() {
    std::lock_guard lock(m_decode_mutex);
    if (m_decoded || state() != LoadState::Loading) {
        return media_core::Ok(false);
    }

    auto result = do_load();
    if (!result) {
        return media_core::Err<bool>(result.error().with_context("asset", m_name));
    }

    m_decoded = true;
    return media_core::Ok(true);
}

void Asset::fire_callbacks() {
    // Callbacks may call load() again; they register into a fresh list
    std::vector<CallbackEntry> callbacks;
    callbacks.swap(m_callbacks);
    for (auto& entry : callbacks) {
        entry.callback(*this);
    }
}

} // namespace media_asset
