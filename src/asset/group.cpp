/// @file group.cpp
/// @brief AssetGroup selection policies and group loading

#include <media_engine/asset/group.hpp>
#include <media_engine/asset/base.hpp>
#include <media_engine/core/config.hpp>
#include <media_engine/core/log.hpp>
#include <media_engine/core/strings.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>

namespace media_asset {

namespace {

/// Parse "name" or "name|weight" ("name|" means weight 1).
/// A weight too large for long long parses as LLONG_MAX.
bool parse_member_entry(const std::string& entry, std::string& name, long long& weight) {
    auto bar = entry.find('|');
    if (bar == std::string::npos) {
        name = entry;
        weight = 1;
        return true;
    }

    name = entry.substr(0, bar);
    std::string number = media_core::trim(entry.substr(bar + 1));
    if (number.empty()) {
        weight = 1;
        return true;
    }

    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), weight);
    if (ptr != number.data() + number.size()) {
        return false;
    }
    if (ec == std::errc::result_out_of_range) {
        weight = number.front() == '-' ? std::numeric_limits<long long>::min()
                                       : std::numeric_limits<long long>::max();
        return true;
    }
    return ec == std::errc();
}

std::vector<std::string> member_entries(const nlohmann::json& value) {
    std::vector<std::string> entries;
    if (value.is_string()) {
        entries = media_core::split_list(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                entries.push_back(media_core::trim(item.get<std::string>()));
            }
        }
    }
    return entries;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

AssetGroup::AssetGroup(std::string name, SelectionType type, std::uint32_t seed)
    : m_name(std::move(name))
    , m_type(type)
    , m_load_key(load_keys::ON_DEMAND)
    , m_rng(seed) {}

std::shared_ptr<AssetGroup> AssetGroup::create(std::string name, SelectionType type, std::uint32_t seed) {
    return std::shared_ptr<AssetGroup>(new AssetGroup(std::move(name), type, seed));
}

media_core::Result<void> AssetGroup::check_weight(
    const std::string& group_name, const std::string& asset_name, long long weight, int total) {
    if (weight < 1 || weight > MAX_WEIGHT) {
        return media_core::Err(media_core::ConfigError::invalid_value(group_name, asset_name,
            "weight must be between 1 and " + std::to_string(MAX_WEIGHT)));
    }
    if (weight > std::numeric_limits<int>::max() - total) {
        return media_core::Err(media_core::ConfigError::invalid_value(group_name, asset_name,
            "total group weight is too large"));
    }
    return media_core::Ok();
}

media_core::Result<std::shared_ptr<AssetGroup>> AssetGroup::from_config(
    const std::string& name,
    const nlohmann::json& config,
    const std::string& member_key,
    const Lookup& lookup,
    std::optional<std::uint32_t> seed) {

    using GroupPtr = std::shared_ptr<AssetGroup>;

    if (!config.is_object()) {
        return media_core::Err<GroupPtr>(
            media_core::ConfigError::invalid_value(name, "", "group config must be a mapping"));
    }

    auto type_name = media_core::json_value_or<std::string>(config, "type", "sequence");
    auto type = parse_selection_type(type_name);
    if (!type) {
        return media_core::Err<GroupPtr>(
            media_core::ConfigError::invalid_value(name, "type", "unknown selection type '" + type_name + "'"));
    }

    auto group = create(name, *type, seed ? *seed : std::random_device{}());
    group->set_load_key(media_core::json_value_or<std::string>(config, "load", load_keys::ON_DEMAND));
    group->m_priority = media_core::json_value_or<int>(config, "priority", 0);

    auto members = config.find(member_key);
    if (members == config.end()) {
        media_core::asset_logger()->warn("Group '{}' has no '{}' entry", name, member_key);
        return media_core::Ok(std::move(group));
    }

    int total = 0;
    for (const auto& entry : member_entries(*members)) {
        std::string member_name;
        long long weight = 1;
        if (!parse_member_entry(entry, member_name, weight) || weight < 1) {
            media_core::asset_logger()->warn("Group '{}': bad member entry '{}', skipped", name, entry);
            continue;
        }

        auto checked = check_weight(name, member_name, weight, total);
        if (!checked) {
            return media_core::Err<GroupPtr>(std::move(checked.error().with_context("member", entry)));
        }

        auto asset = lookup ? lookup(member_name) : nullptr;
        if (!asset) {
            media_core::asset_logger()->warn("Group '{}': no asset named '{}', skipped", name, member_name);
            continue;
        }

        total += static_cast<int>(weight);
        group->m_members.push_back(Member{std::move(asset), static_cast<int>(weight)});
    }

    group->rebuild();
    return media_core::Ok(std::move(group));
}

// =============================================================================
// Membership
// =============================================================================

media_core::Result<void> AssetGroup::add_member(std::shared_ptr<Asset> asset, int weight) {
    if (!asset) {
        return media_core::Err(media_core::ConfigError::invalid_value(m_name, "member", "null asset"));
    }
    auto checked = check_weight(m_name, asset->name(), weight, m_total_weight);
    if (!checked) {
        return checked;
    }

    m_members.push_back(Member{std::move(asset), weight});
    rebuild();
    return media_core::Ok();
}

bool AssetGroup::remove_member(const std::string& asset_name) {
    auto before = m_members.size();
    std::vector<const Asset*> removed;

    m_members.erase(
        std::remove_if(m_members.begin(), m_members.end(),
            [&](const Member& member) {
                if (media_core::iequals(member.asset->name(), asset_name)) {
                    removed.push_back(member.asset.get());
                    return true;
                }
                return false;
            }),
        m_members.end());

    if (m_members.size() == before) {
        return false;
    }

    rebuild();

    bool was_loading = !m_loading.empty();
    for (const Asset* asset : removed) {
        m_loading.erase(asset);
    }
    if (was_loading && m_loading.empty()) {
        fire_callbacks();
    }
    return true;
}

void AssetGroup::rebuild() {
    m_total_weight = 0;
    m_cumulative.clear();
    m_cumulative.reserve(m_members.size());
    for (const auto& member : m_members) {
        m_total_weight += member.weight;
        m_cumulative.push_back(m_total_weight);
    }
    m_sequence_pos = 0;
    m_last_pick.reset();
    m_sent.clear();
}

// =============================================================================
// Selection
// =============================================================================

std::shared_ptr<Asset> AssetGroup::asset() {
    if (m_members.empty()) {
        return nullptr;
    }

    switch (m_type) {
        case SelectionType::Sequence: return next_in_sequence();
        case SelectionType::Random: return next_random();
        case SelectionType::RandomForceNext: return next_random_force_next();
        case SelectionType::RandomForceAll: return next_random_force_all();
    }
    return nullptr;
}

std::size_t AssetGroup::pick_weighted(const std::vector<std::size_t>& candidates) {
    int total = 0;
    for (std::size_t index : candidates) {
        total += m_members[index].weight;
    }

    std::uniform_int_distribution<int> dist(1, total);
    int value = dist(m_rng);

    int cumulative = 0;
    for (std::size_t index : candidates) {
        cumulative += m_members[index].weight;
        if (value <= cumulative) {
            return index;
        }
    }
    return candidates.back();
}

std::shared_ptr<Asset> AssetGroup::next_in_sequence() {
    // Member i covers positions [cumulative[i-1], cumulative[i])
    auto it = std::upper_bound(m_cumulative.begin(), m_cumulative.end(), m_sequence_pos);
    auto index = static_cast<std::size_t>(it - m_cumulative.begin());
    m_sequence_pos = (m_sequence_pos + 1) % m_total_weight;
    return m_members[index].asset;
}

std::shared_ptr<Asset> AssetGroup::next_random() {
    std::vector<std::size_t> all(m_members.size());
    for (std::size_t i = 0; i < all.size(); ++i) all[i] = i;
    return m_members[pick_weighted(all)].asset;
}

std::shared_ptr<Asset> AssetGroup::next_random_force_next() {
    if (m_members.size() == 1) {
        m_last_pick = 0;
        return m_members.front().asset;
    }

    std::vector<std::size_t> candidates;
    candidates.reserve(m_members.size());
    for (std::size_t i = 0; i < m_members.size(); ++i) {
        if (!m_last_pick || *m_last_pick != i) {
            candidates.push_back(i);
        }
    }

    std::size_t index = pick_weighted(candidates);
    m_last_pick = index;
    return m_members[index].asset;
}

std::shared_ptr<Asset> AssetGroup::next_random_force_all() {
    if (m_sent.size() >= m_members.size()) {
        m_sent.clear();
    }

    std::vector<std::size_t> candidates;
    candidates.reserve(m_members.size() - m_sent.size());
    for (std::size_t i = 0; i < m_members.size(); ++i) {
        if (m_sent.count(i) == 0) {
            candidates.push_back(i);
        }
    }

    std::size_t index = pick_weighted(candidates);
    m_sent.insert(index);
    return m_members[index].asset;
}

// =============================================================================
// Loading
// =============================================================================

void AssetGroup::load(Callback callback, std::optional<int> priority) {
    if (priority) {
        m_priority = *priority;
    }
    if (callback) {
        m_callbacks.push_back(std::move(callback));
    }

    std::weak_ptr<AssetGroup> weak_self = weak_from_this();
    for (const auto& member : m_members) {
        Asset* asset = member.asset.get();
        if (asset->is_loaded() || m_loading.count(asset) > 0) {
            continue;
        }

        m_loading.insert(asset);
        asset->load(
            [weak_self](Asset& loaded) {
                if (auto self = weak_self.lock()) {
                    self->member_loaded(loaded);
                }
            },
            priority, this);
    }

    if (m_loading.empty()) {
        fire_callbacks();
    }
}

void AssetGroup::member_loaded(Asset& asset) {
    if (m_loading.erase(&asset) == 0) {
        return;
    }
    if (m_loading.empty()) {
        media_core::asset_logger()->debug("Group '{}' loaded", m_name);
        fire_callbacks();
    }
}

void AssetGroup::fire_callbacks() {
    std::vector<Callback> callbacks;
    callbacks.swap(m_callbacks);
    for (auto& callback : callbacks) {
        callback(*this);
    }
}

std::size_t AssetGroup::unload() {
    std::size_t count = 0;
    for (const auto& member : m_members) {
        auto result = member.asset->unload();
        if (!result) {
            media_core::asset_logger()->debug("Group '{}': {}", m_name, result.error().message());
            continue;
        }
        ++count;
    }
    return count;
}

} // namespace media_asset
