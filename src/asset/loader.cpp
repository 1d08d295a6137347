/// @file loader.cpp
/// @brief AssetLoader thread loop

#include <media_engine/asset/loader.hpp>
#include <media_engine/asset/base.hpp>
#include <media_engine/core/log.hpp>

namespace media_asset {

AssetLoader::AssetLoader(LoadQueue& load_queue,
                         CompletionQueue& completions,
                         media_core::CrashChannel& crashes,
                         std::chrono::milliseconds pop_timeout)
    : m_load_queue(load_queue)
    , m_completions(completions)
    , m_crashes(crashes)
    , m_pop_timeout(pop_timeout) {}

AssetLoader::~AssetLoader() {
    stop();
}

void AssetLoader::start() {
    if (m_failed.load()) {
        media_core::loader_logger()->warn("Loader thread failed earlier, not restarting");
        return;
    }
    if (m_stopped.load() || m_running.exchange(true)) {
        return;
    }

    m_thread = std::thread([this]() { run(); });
    media_core::loader_logger()->debug("Loader thread started");
}

void AssetLoader::stop() {
    if (m_stopped.exchange(true)) {
        return;
    }

    m_stop_requested.store(true);
    if (m_thread.joinable()) {
        m_thread.join();
    }

    auto discarded = m_load_queue.drain().size() + m_completions.drain().size();
    if (discarded > 0) {
        media_core::loader_logger()->debug("Loader stopped, discarded {} queued entries", discarded);
    } else {
        media_core::loader_logger()->debug("Loader stopped");
    }
}

void AssetLoader::run() {
    auto log = media_core::loader_logger();

    try {
        while (true) {
            auto request = m_load_queue.pop_for(m_pop_timeout);

            if (m_stop_requested.load()) {
                break;
            }
            if (!request) {
                continue;
            }

            auto& asset = request->asset;
            auto decoded = asset->decode();
            if (!decoded) {
                media_core::debug::record_error(decoded.error());
                fail(media_core::build_error_chain(decoded.error()));
                return;
            }

            if (decoded.value()) {
                m_decoded.fetch_add(1);
                log->trace("Decoded '{}' (priority {})", asset->name(), request->priority);
            } else {
                log->trace("Skipped '{}', nothing to decode", asset->name());
            }

            m_completions.push(std::move(asset));
        }
    } catch (...) {
        // Anything escaping a decode hook ends the thread via the crash channel
        fail(media_core::describe_current_exception());
        return;
    }

    m_running.store(false);
}

void AssetLoader::fail(const std::string& message) {
    m_failed.store(true);
    m_running.store(false);
    media_core::loader_logger()->critical("Loader thread failed: {}", message);
    m_crashes.report(THREAD_NAME, message);
}

} // namespace media_asset
