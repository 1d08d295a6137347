/// @file main.cpp
/// @brief media_asset_demo - discovers and preloads a machine folder's assets
///
/// Registers the built-in asset kinds, walks the machine folder (and any mode
/// folders listed in the config), preloads, and ticks the clock until the
/// "assets" boot hold is released. Then starts each mode once to show
/// mode-triggered loading, and shuts down.
///
/// Config file (JSON, optional):
/// {
///   "log_level": "debug",
///   "asset_manager": { "loader_timeout_ms": 100, "poll_interval_ms": 0 },
///   "assets": { "texts": { "default": { "load": "preload" } } },
///   "texts": { "intro": { "priority": 5 } },
///   "text_groups": { "greetings": { "texts": "hello|2, intro", "type": "sequence" } },
///   "modes": [ { "name": "attract", "path": "modes/attract" } ]
/// }

#include <media_engine/core/core.hpp>
#include <media_engine/event/event.hpp>
#include <media_engine/asset/asset.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] MACHINE_PATH [CONFIG_JSON]\n"
              << "\n"
              << "Arguments:\n"
              << "  MACHINE_PATH    Machine folder holding bytes/ and texts/ folders\n"
              << "  CONFIG_JSON     Machine config (defaults preload every asset)\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n";
}

void print_version() {
    std::cout << "media_asset_demo " << media_core::MEDIA_CORE_VERSION << "\n";
}

/// Config used when no file is given: every built-in kind preloads
nlohmann::json default_machine_config() {
    return nlohmann::json{
        {"assets", {
            {"bytes", {{"default", {{"load", "preload"}}}}},
            {"texts", {{"default", {{"load", "preload"}}}}},
        }},
    };
}

std::vector<media_asset::ModeInfo> read_modes(const nlohmann::json& config, const fs::path& machine_path) {
    std::vector<media_asset::ModeInfo> modes;
    auto it = config.find("modes");
    if (it == config.end() || !it->is_array()) {
        return modes;
    }

    for (const auto& entry : *it) {
        auto name = media_core::json_value_or<std::string>(entry, "name", "");
        if (name.empty()) {
            spdlog::warn("Skipping mode entry without a name");
            continue;
        }
        auto path = media_core::json_value_or<std::string>(entry, "path", "modes/" + name);
        media_asset::ModeInfo mode;
        mode.name = name;
        mode.path = (machine_path / path).string();
        mode.config = entry.value("config", nlohmann::json::object());
        modes.push_back(std::move(mode));
    }
    return modes;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage(argv[0]);
        return 1;
    }

    fs::path machine_path = positional[0];
    if (!fs::is_directory(machine_path)) {
        std::cerr << "Machine path does not exist: " << machine_path << "\n";
        return 1;
    }

    nlohmann::json machine_config = default_machine_config();
    if (positional.size() == 2) {
        auto loaded = media_core::load_json_file(positional[1]);
        if (!loaded) {
            std::cerr << media_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
        machine_config = std::move(*loaded);
        if (!machine_config.is_object()) {
            std::cerr << "Config must be a JSON object: " << positional[1] << "\n";
            return 1;
        }
    }

    // Logging
    media_core::LogConfig log_config;
    if (auto level = media_core::parse_log_level(
            media_core::json_value_or<std::string>(machine_config, "log_level", "info"))) {
        log_config.level = *level;
    }
    media_core::configure_logging(log_config);
    spdlog::debug("Log level: {}", media_core::log_level_name(log_config.level));

    auto manager_config = media_asset::AssetManagerConfig::from_json(
        machine_config.value("asset_manager", nlohmann::json::object()));
    if (!manager_config) {
        spdlog::error("{}", media_core::build_error_chain(manager_config.error()));
        return 1;
    }
    manager_config->with_machine_path(machine_path.string());

    // Host services
    media_core::Clock clock;
    media_event::EventBus bus;
    media_core::BootHolds boot;
    media_core::CrashChannel crashes;

    boot.add_boot_hold(media_asset::AssetManager::BOOT_HOLD);
    boot.on_ready([]() { spdlog::info("Boot complete"); });

    bus.subscribe<media_asset::LoadingAssets>([](const media_asset::LoadingAssets& e) {
        spdlog::info("Loading assets: {}/{} ({}%), {} remaining", e.loaded, e.total, e.percent, e.remaining);
    });

    media_asset::AssetManager manager(std::move(*manager_config), clock, bus, boot, crashes);

    for (auto registered : {manager.register_asset_class<media_asset::BytesAsset>(),
                            manager.register_asset_class<media_asset::TextAsset>()}) {
        if (!registered) {
            spdlog::error("{}", media_core::build_error_chain(registered.error()));
            return 1;
        }
    }

    auto modes = read_modes(machine_config, machine_path);
    auto preloaded = manager.create_assets(machine_config, modes);
    if (!preloaded) {
        spdlog::error("{}", media_core::build_error_chain(preloaded.error()));
        return 1;
    }

    // Main loop: tick until boot completes or the loader crashes
    auto run_until = [&](auto done) -> bool {
        while (!done()) {
            clock.tick();
            bus.process();
            if (auto crashed = crashes.check(); !crashed) {
                spdlog::critical("{}", media_core::build_error_chain(crashed.error()));
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        bus.process();
        return true;
    };

    if (!run_until([&]() { return boot.is_boot_complete(); })) {
        manager.shutdown();
        return 2;
    }

    for (const auto& mode : modes) {
        auto mode_assets = manager.on_mode_start(mode.name);
        spdlog::info("Mode '{}' started, {} assets requested", mode.name, mode_assets.size());
        if (!run_until([&]() { return !manager.is_polling(); })) {
            manager.shutdown();
            return 2;
        }
        auto unloaded = manager.on_mode_stop(mode_assets);
        spdlog::info("Mode '{}' stopped, {} assets unloaded", mode.name, unloaded);
    }

    for (const auto& info : manager.asset_classes()) {
        for (const auto& asset : manager.assets(info.attribute)) {
            spdlog::info("  {}:{} [{}] {}", info.attribute, asset->name(),
                         media_asset::load_state_name(asset->state()), asset->file());
        }
    }

    manager.shutdown();
    media_core::shutdown_logging();
    return 0;
}
