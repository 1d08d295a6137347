#pragma once

/// @file loader.hpp
/// @brief Background thread that decodes queued assets

#include "types.hpp"
#include <media_engine/core/crash.hpp>
#include <media_engine/structures/blocking_queue.hpp>
#include <media_engine/structures/priority_queue.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace media_asset {

/// Pending decode requests, highest priority first
using LoadQueue = media_structures::PriorityBlockingQueue<LoadRequest, LoadPrecedes>;

/// Assets whose request has been handled, in completion order
using CompletionQueue = media_structures::BlockingQueue<std::shared_ptr<Asset>>;

// =============================================================================
// AssetLoader
// =============================================================================

/// Single worker that owns blocking storage access for decoding.
///
/// The loop waits on the load queue with a short timeout so a stop request is
/// noticed promptly. Each dequeued asset is decoded unless it no longer needs
/// it, and is then always pushed onto the completion queue. Any failure is
/// fatal to the thread: it is posted to the crash channel and the asset is
/// left Loading.
class AssetLoader {
public:
    AssetLoader(LoadQueue& load_queue,
                CompletionQueue& completions,
                media_core::CrashChannel& crashes,
                std::chrono::milliseconds pop_timeout = std::chrono::milliseconds{100});

    /// Stops the thread
    ~AssetLoader();

    // Non-copyable, non-movable (the thread refers to this)
    AssetLoader(const AssetLoader&) = delete;
    AssetLoader& operator=(const AssetLoader&) = delete;

    /// Start the thread. Does nothing if it is running, has been stopped,
    /// or has failed; a failed loader stays down until stop().
    void start();

    /// Stop the thread, blocking until it has exited, then discard both
    /// queues. A decode already in progress runs to completion first.
    void stop();

    /// Check whether the thread is running its loop
    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }

    /// Check whether the thread exited because of a failure
    [[nodiscard]] bool has_failed() const noexcept { return m_failed.load(); }

    /// Check whether stop() has been called
    [[nodiscard]] bool is_stopped() const noexcept { return m_stopped.load(); }

    /// Number of decodes performed (skipped requests are not counted)
    [[nodiscard]] std::uint64_t decoded_count() const noexcept { return m_decoded.load(); }

    /// Thread name used in logs and crash reports
    static constexpr const char* THREAD_NAME = "asset_loader";

private:
    void run();
    void fail(const std::string& message);

    LoadQueue& m_load_queue;
    CompletionQueue& m_completions;
    media_core::CrashChannel& m_crashes;
    std::chrono::milliseconds m_pop_timeout;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_failed{false};
    std::atomic<std::uint64_t> m_decoded{0};
};

} // namespace media_asset
