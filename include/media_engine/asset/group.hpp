#pragma once

/// @file group.hpp
/// @brief Named asset collections with selection policies

#include "types.hpp"
#include <media_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace media_asset {

// =============================================================================
// AssetGroup
// =============================================================================

/// A named, ordered list of weighted assets exposing one "pick a member"
/// accessor. Membership and weights may change; derived selection state is
/// rebuilt on every change.
class AssetGroup : public std::enable_shared_from_this<AssetGroup> {
public:
    using Callback = std::function<void(AssetGroup&)>;
    using Lookup = std::function<std::shared_ptr<Asset>(const std::string&)>;

    /// A member and its weight (>= 1)
    struct Member {
        std::shared_ptr<Asset> asset;
        int weight = 1;
    };

    /// Largest accepted member weight
    static constexpr int MAX_WEIGHT = 10000;

    /// Create an empty group. Groups only exist behind a shared_ptr because
    /// member completions reach them through a weak reference.
    [[nodiscard]] static std::shared_ptr<AssetGroup> create(
        std::string name, SelectionType type, std::uint32_t seed = std::random_device{}());

    // Non-copyable (member callbacks refer back to the group)
    AssetGroup(const AssetGroup&) = delete;
    AssetGroup& operator=(const AssetGroup&) = delete;

    /// Build a group from its config section.
    ///
    /// Recognised keys: `type` (default "sequence"), `load` (default
    /// "on_demand") and `member_key`, a list such as "a, b|3, c|" or a JSON
    /// array of the same strings. A member with no weight has weight 1.
    /// Members that `lookup` cannot resolve, or with a weight below 1, are
    /// logged and skipped. A weight above MAX_WEIGHT, or a total weight that
    /// does not fit in an int, fails with ConfigError::invalid_value.
    [[nodiscard]] static media_core::Result<std::shared_ptr<AssetGroup>> from_config(
        const std::string& name,
        const nlohmann::json& config,
        const std::string& member_key,
        const Lookup& lookup,
        std::optional<std::uint32_t> seed = std::nullopt);

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] SelectionType selection_type() const noexcept { return m_type; }
    [[nodiscard]] const std::string& load_key() const noexcept { return m_load_key; }
    void set_load_key(std::string key) { m_load_key = std::move(key); }

    [[nodiscard]] int priority() const noexcept { return m_priority; }

    // =========================================================================
    // Membership
    // =========================================================================

    /// Append a member. Fails for a null asset, a weight outside
    /// [1, MAX_WEIGHT] or a total weight that would overflow.
    [[nodiscard]] media_core::Result<void> add_member(std::shared_ptr<Asset> asset, int weight = 1);

    /// Remove every member with this asset name (case-insensitive)
    /// @return true if a member was removed
    bool remove_member(const std::string& asset_name);

    [[nodiscard]] const std::vector<Member>& members() const noexcept { return m_members; }
    [[nodiscard]] std::size_t size() const noexcept { return m_members.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_members.empty(); }

    /// Sum of member weights
    [[nodiscard]] int total_weight() const noexcept { return m_total_weight; }

    // =========================================================================
    // Selection
    // =========================================================================

    /// Pick a member according to the selection type
    /// @return nullptr for an empty group
    [[nodiscard]] std::shared_ptr<Asset> asset();

    /// Re-seed the random source
    void seed(std::uint32_t value) { m_rng.seed(value); }

    // =========================================================================
    // Loading
    // =========================================================================

    /// Load every member that is not loaded yet. Callbacks fire once the last
    /// of them finishes, or immediately when none needs loading.
    /// @param priority Forwarded to every member load
    void load(Callback callback = {}, std::optional<int> priority = std::nullopt);

    /// Check whether members requested by load() are still in flight
    [[nodiscard]] bool is_loading() const noexcept { return !m_loading.empty(); }

    /// Number of members requested by load() that are still in flight
    [[nodiscard]] std::size_t loading_count() const noexcept { return m_loading.size(); }

    /// Unload every member that is not loading
    /// @return Number of members unloaded
    std::size_t unload();

private:
    AssetGroup(std::string name, SelectionType type, std::uint32_t seed);

    /// Check that `weight` can join a group whose weights sum to `total`
    [[nodiscard]] static media_core::Result<void> check_weight(
        const std::string& group_name, const std::string& asset_name, long long weight, int total);

    void rebuild();
    void member_loaded(Asset& asset);
    void fire_callbacks();

    /// Weighted draw over member indices
    std::size_t pick_weighted(const std::vector<std::size_t>& candidates);

    std::shared_ptr<Asset> next_in_sequence();
    std::shared_ptr<Asset> next_random();
    std::shared_ptr<Asset> next_random_force_next();
    std::shared_ptr<Asset> next_random_force_all();

    std::string m_name;
    SelectionType m_type;
    std::string m_load_key;
    int m_priority = 0;

    std::vector<Member> m_members;
    int m_total_weight = 0;

    // Selection state
    std::vector<int> m_cumulative;            // Running weight sum per member
    int m_sequence_pos = 0;                   // Position in [0, total weight)
    std::optional<std::size_t> m_last_pick;   // For RandomForceNext
    std::set<std::size_t> m_sent;             // For RandomForceAll
    std::mt19937 m_rng;

    // Loading state
    std::set<const Asset*> m_loading;
    std::vector<Callback> m_callbacks;
};

} // namespace media_asset
