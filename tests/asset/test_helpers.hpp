#pragma once

/// @file test_helpers.hpp
/// @brief Shared fixtures for media_asset tests

#include <media_engine/asset/asset.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace media_asset::testing {

/// Records enqueue calls without queueing anything
class FakeDispatcher : public LoadDispatcher {
public:
    FakeDispatcher() = default;

    /// Also forward every request to a load queue
    explicit FakeDispatcher(LoadQueue& queue) : m_queue(&queue) {}

    void enqueue(std::shared_ptr<Asset> asset) override {
        if (m_queue) {
            m_queue->push(LoadRequest{asset, asset->priority(), asset->creation_id()});
        }
        enqueued.push_back(std::move(asset));
    }

    std::vector<std::shared_ptr<Asset>> enqueued;

private:
    LoadQueue* m_queue = nullptr;
};

/// Thread-safe record of decode order
class DecodeLog {
public:
    void record(const std::string& name) {
        std::lock_guard lock(m_mutex);
        m_names.push_back(name);
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::lock_guard lock(m_mutex);
        return m_names;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_names;
};

/// Asset whose decode can be told to fail or throw
class TestAsset : public Asset {
public:
    enum class Mode { Succeed, Fail, Throw };

    TestAsset(AssetDescriptor descriptor, LoadDispatcher& dispatcher,
              std::shared_ptr<DecodeLog> log = nullptr)
        : Asset(std::move(descriptor), dispatcher)
        , m_log(std::move(log)) {}

    /// Class registration that builds TestAssets sharing one decode log
    static AssetClassInfo class_info(std::shared_ptr<DecodeLog> log = nullptr) {
        AssetClassInfo info;
        info.attribute = "tests";
        info.config_section = "tests";
        info.path_string = "tests";
        info.with_extensions({"tst"})
            .with_group_section("test_groups")
            .with_factory([log](AssetDescriptor descriptor, LoadDispatcher& dispatcher) -> std::shared_ptr<Asset> {
                return std::make_shared<TestAsset>(std::move(descriptor), dispatcher, log);
            });
        return info;
    }

    std::atomic<int> loads{0};
    std::atomic<int> unloads{0};
    std::atomic<Mode> mode{Mode::Succeed};

protected:
    media_core::Result<void> do_load() override {
        ++loads;
        if (m_log) {
            m_log->record(name());
        }
        switch (mode.load()) {
            case Mode::Fail:
                return media_core::Err(media_core::Error(media_core::ErrorCode::IOError, "corrupt data"));
            case Mode::Throw:
                throw std::runtime_error("decoder exploded");
            case Mode::Succeed:
                break;
        }
        return media_core::Ok();
    }

    void do_unload() override {
        ++unloads;
    }

private:
    std::shared_ptr<DecodeLog> m_log;
};

inline std::shared_ptr<TestAsset> make_test_asset(LoadDispatcher& dispatcher,
                                                  const std::string& name,
                                                  nlohmann::json config = nlohmann::json::object()) {
    AssetDescriptor descriptor{name, "tests", "/virtual/" + name + ".tst", std::move(config)};
    return std::make_shared<TestAsset>(std::move(descriptor), dispatcher);
}

/// Run a queued asset through decode and completion on the calling thread
inline void complete_load(Asset& asset) {
    auto decoded = asset.decode();
    if (decoded.is_err()) {
        throw std::runtime_error(decoded.error().message());
    }
    asset.mark_loaded();
}

/// Spin until `done` holds or the timeout expires
template<typename Pred>
bool wait_until(Pred done, std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return true;
}

/// Scratch folder removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> s_counter{0};
        m_path = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
             "_" + std::to_string(s_counter.fetch_add(1)));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Write a file below the folder, creating parents
    std::filesystem::path write(const std::string& relative, const std::string& contents) const {
        auto target = m_path / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out << contents;
        return target;
    }

private:
    std::filesystem::path m_path;
};

} // namespace media_asset::testing
