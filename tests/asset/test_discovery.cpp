/// @file test_discovery.cpp
/// @brief Tests for AssetDiscovery folder walks and config layering

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace media_asset;
using namespace media_asset::testing;
namespace fs = std::filesystem;

namespace {

std::string absolute(const fs::path& path) {
    return fs::absolute(path).lexically_normal().string();
}

} // namespace

TEST_CASE("AssetDiscovery: build_defaults", "[asset][discovery]") {
    auto info = TextAsset::class_info();

    SECTION("no assets section") {
        auto defaults = AssetDiscovery::build_defaults(info, nlohmann::json::object());
        REQUIRE(defaults.is_ok());
        REQUIRE(defaults.value() == nlohmann::json{{"default", nlohmann::json::object()}});
    }

    SECTION("folder sections start from default") {
        nlohmann::json machine = {{"assets", {{"texts", {
            {"default", {{"load", "preload"}, {"priority", 1}}},
            {"credits", {{"load", "on_demand"}}},
        }}}}};
        auto defaults = AssetDiscovery::build_defaults(info, machine);
        REQUIRE(defaults.is_ok());
        REQUIRE(defaults.value()["default"]["load"] == "preload");
        REQUIRE(defaults.value()["credits"]["load"] == "on_demand");
        REQUIRE(defaults.value()["credits"]["priority"] == 1);
    }

    SECTION("non-mapping section") {
        nlohmann::json machine = {{"assets", {{"texts", "preload"}}}};
        auto defaults = AssetDiscovery::build_defaults(info, machine);
        REQUIRE(defaults.is_err());
        REQUIRE(defaults.error().is<media_core::ConfigError>());
    }
}

TEST_CASE("AssetDiscovery: folder walk", "[asset][discovery]") {
    TempDir machine("media_engine_discovery");
    auto intro = machine.write("texts/intro.txt", "intro");
    auto hello = machine.write("texts/Hello.TXT", "hello");
    auto roll = machine.write("texts/credits/roll.txt", "roll");
    machine.write("texts/ignore.bin", "x");
    machine.write("texts/misc/note.txt", "note");

    auto info = TextAsset::class_info();
    nlohmann::json machine_config = {{"assets", {{"texts", {
        {"default", {{"load", "preload"}}},
        {"credits", {{"load", "on_demand"}, {"priority", 2}}},
    }}}}};
    auto defaults = AssetDiscovery::build_defaults(info, machine_config).value();

    AssetDiscovery discovery(machine.path().string());

    SECTION("files become assets with layered config") {
        nlohmann::json section = {{"intro", {{"priority", 5}}}};
        auto found = discovery.discover(info, defaults, section, machine.path().string());
        REQUIRE(found.is_ok());

        const auto& assets = found.value();
        REQUIRE(assets.size() == 4);
        REQUIRE_FALSE(assets.contains("ignore"));

        REQUIRE(assets["intro"]["load"] == "preload");
        REQUIRE(assets["intro"]["priority"] == 5);
        REQUIRE(assets["intro"]["file"] == absolute(intro));

        // Names are lower-cased stems
        REQUIRE(assets["hello"]["file"] == absolute(hello));

        // Folder defaults apply below the class folder
        REQUIRE(assets["roll"]["load"] == "on_demand");
        REQUIRE(assets["roll"]["priority"] == 2);
        REQUIRE(assets["roll"]["file"] == absolute(roll));

        // Folders without their own section use the class default
        REQUIRE(assets["note"]["load"] == "preload");
    }

    SECTION("config entry matched by file name renames the asset") {
        nlohmann::json section = {{"opening", {{"file", "intro.txt"}, {"priority", 9}}}};
        auto found = discovery.discover(info, defaults, section, machine.path().string());
        REQUIRE(found.is_ok());
        REQUIRE(found.value().contains("opening"));
        REQUIRE_FALSE(found.value().contains("intro"));
        REQUIRE(found.value()["opening"]["priority"] == 9);
    }

    SECTION("config entry matched case-insensitively") {
        nlohmann::json section = {{"HELLO", {{"load", "on_demand"}}}};
        auto found = discovery.discover(info, defaults, section, machine.path().string());
        REQUIRE(found.is_ok());
        REQUIRE(found.value()["HELLO"]["load"] == "on_demand");
    }

    SECTION("missing load key is a config error") {
        auto no_defaults = AssetDiscovery::build_defaults(info, nlohmann::json::object()).value();
        auto found = discovery.discover(info, no_defaults, nlohmann::json(), machine.path().string());
        REQUIRE(found.is_err());
        REQUIRE(found.error().as<media_core::ConfigError>()->key == "load");
    }

    SECTION("mode_start outside a mode is rejected") {
        nlohmann::json section = {{"intro", {{"load", "mode_start"}}}};
        auto found = discovery.discover(info, defaults, section, machine.path().string());
        REQUIRE(found.is_err());
        REQUIRE(found.error().as<media_core::ConfigError>()->kind ==
                media_core::ConfigError::Kind::InvalidValue);
    }

    SECTION("missing class folder finds nothing") {
        auto found = discovery.discover(BytesAsset::class_info(), defaults, nlohmann::json(),
                                        machine.path().string());
        REQUIRE(found.is_ok());
        REQUIRE(found.value().empty());
    }
}

TEST_CASE("AssetDiscovery: mode folders", "[asset][discovery]") {
    TempDir machine("media_engine_discovery_mode");
    machine.write("texts/common.txt", "shared");
    auto local = machine.write("modes/attract/texts/title.txt", "title");
    auto mode_root = (machine.path() / "modes" / "attract").string();

    auto info = TextAsset::class_info();
    auto defaults = AssetDiscovery::build_defaults(info, {{"assets", {{"texts", {
        {"default", {{"load", "mode_start"}}},
    }}}}}).value();
    AssetDiscovery discovery(machine.path().string());

    SECTION("mode_start becomes <mode>_start") {
        auto found = discovery.discover(info, defaults, nlohmann::json(), mode_root, "attract");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().size() == 1);
        REQUIRE(found.value()["title"]["load"] == "attract_start");
        REQUIRE(found.value()["title"]["file"] == absolute(local));
    }

    SECTION("configured file falls back to the machine folder") {
        nlohmann::json section = {{"shared", {{"file", "common.txt"}}}};
        auto found = discovery.discover(info, defaults, section, mode_root, "attract");
        REQUIRE(found.is_ok());
        REQUIRE(found.value()["shared"]["load"] == "attract_start");
        REQUIRE(found.value()["shared"]["file"] == absolute(machine.path() / "texts" / "common.txt"));
    }

    SECTION("configured entry needs a file") {
        nlohmann::json section = {{"ghost", {{"priority", 1}}}};
        auto found = discovery.discover(info, defaults, section, mode_root, "attract");
        REQUIRE(found.is_err());
        REQUIRE(found.error().as<media_core::ConfigError>()->key == "file");
    }

    SECTION("configured file that exists nowhere") {
        nlohmann::json section = {{"ghost", {{"file", "ghost.txt"}}}};
        auto found = discovery.discover(info, defaults, section, mode_root, "attract");
        REQUIRE(found.is_err());
        REQUIRE(found.error().is<media_core::LookupError>());
    }
}

TEST_CASE("AssetDiscovery: locate_asset_file", "[asset][discovery]") {
    TempDir machine("media_engine_locate");
    auto machine_file = machine.write("texts/a.txt", "machine");
    auto mode_file = machine.write("modes/m/texts/a.txt", "mode");
    machine.write("texts/b.txt", "machine");

    AssetDiscovery discovery(machine.path().string());
    auto mode_root = (machine.path() / "modes" / "m").string();

    REQUIRE(discovery.locate_asset_file("a.txt", "texts", mode_root).value() == absolute(mode_file));
    REQUIRE(discovery.locate_asset_file("a.txt", "texts").value() == absolute(machine_file));
    REQUIRE(discovery.locate_asset_file("b.txt", "texts", mode_root).is_ok());
    REQUIRE(discovery.locate_asset_file("c.txt", "texts", mode_root).is_err());
}
