#pragma once

/// @file base.hpp
/// @brief Asset base class and its load/unload state machine

#include "types.hpp"
#include <media_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_asset {

// =============================================================================
// LoadDispatcher
// =============================================================================

/// Receives assets that need decoding. Implemented by AssetManager.
class LoadDispatcher {
public:
    virtual ~LoadDispatcher() = default;

    /// Queue an asset that has just been marked Loading
    virtual void enqueue(std::shared_ptr<Asset> asset) = 0;
};

// =============================================================================
// Asset
// =============================================================================

/// A named, lazily loaded media resource.
///
/// States: Unloaded -> Loading -> Loaded -> (unloading) -> Unloaded.
/// All state changes except the decode itself happen on the caller thread.
/// Concrete kinds implement do_load() (loader thread, may block) and
/// do_unload() (caller thread, must tolerate a never-loaded asset).
///
/// An asset keeps a reference to the dispatcher that created it (normally
/// its AssetManager). Shared pointers to an asset, including AssetSet and
/// ModeAssets, must not be used after that dispatcher is destroyed.
class Asset : public std::enable_shared_from_this<Asset> {
public:
    using Callback = std::function<void(Asset&)>;

    Asset(AssetDescriptor descriptor, LoadDispatcher& dispatcher);
    virtual ~Asset() = default;

    // Non-copyable, non-movable (shared by pointer)
    Asset(const Asset&) = delete;
    Asset& operator=(const Asset&) = delete;

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::string& class_id() const noexcept { return m_class_id; }
    [[nodiscard]] std::uint64_t creation_id() const noexcept { return m_creation_id; }
    [[nodiscard]] const std::string& file() const noexcept { return m_file; }
    [[nodiscard]] const nlohmann::json& config() const noexcept { return m_config; }

    /// Load trigger key from config ("preload", "on_demand", "<mode>_start")
    [[nodiscard]] std::string load_key() const;

    [[nodiscard]] int priority() const noexcept { return m_priority; }
    void set_priority(int priority) noexcept { m_priority = priority; }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] LoadState state() const noexcept { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_loaded() const noexcept { return state() == LoadState::Loaded; }
    [[nodiscard]] bool is_loading() const noexcept { return state() == LoadState::Loading; }
    [[nodiscard]] bool is_unloading() const noexcept { return m_unloading.load(std::memory_order_acquire); }

    /// Number of completion callbacks waiting to fire
    [[nodiscard]] std::size_t pending_callbacks() const noexcept { return m_callbacks.size(); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Request the asset.
    /// @param callback Fired once the asset is loaded (empty is allowed)
    /// @param priority Replaces the stored priority for this and later requests
    /// @param owner Optional token; while a callback with the same non-null
    ///        token is pending, further ones are dropped
    ///
    /// A loaded asset fires its callbacks synchronously and queues nothing.
    /// Otherwise the asset becomes Loading and is handed to the dispatcher,
    /// even if it is already Loading.
    void load(Callback callback = {}, std::optional<int> priority = std::nullopt,
              const void* owner = nullptr);

    /// Release the asset synchronously.
    /// Fails with StateError::load_in_progress while the asset is Loading.
    [[nodiscard]] media_core::Result<void> unload();

    /// Loading -> Loaded and fire callbacks. Called by the manager's poll.
    /// @return false if the completion is stale and the asset was left as is
    bool mark_loaded();

    /// Decode on the loader thread under the decode section.
    /// Skips the work when the asset is already decoded or no longer Loading.
    /// @return true if do_load() ran
    [[nodiscard]] media_core::Result<bool> decode();

protected:
    /// Read the asset into memory. Runs on the loader thread.
    [[nodiscard]] virtual media_core::Result<void> do_load() = 0;

    /// Release memory. Runs on the caller thread, must be idempotent.
    virtual void do_unload() = 0;

private:
    struct CallbackEntry {
        Callback callback;
        const void* owner = nullptr;
    };

    void fire_callbacks();

    static std::uint64_t next_creation_id() noexcept;

    std::string m_name;
    std::string m_class_id;
    std::string m_file;
    nlohmann::json m_config;
    std::uint64_t m_creation_id;
    int m_priority;

    LoadDispatcher& m_dispatcher;  // Not owned, must outlive every load()

    std::atomic<LoadState> m_state{LoadState::Unloaded};
    std::atomic<bool> m_unloading{false};
    bool m_decoded = false;  // Guarded by m_decode_mutex
    std::mutex m_decode_mutex;

    std::vector<CallbackEntry> m_callbacks;
};

} // namespace media_asset
