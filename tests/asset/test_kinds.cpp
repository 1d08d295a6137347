/// @file test_kinds.cpp
/// @brief Tests for the built-in BytesAsset and TextAsset kinds

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace media_asset;
using namespace media_asset::testing;

TEST_CASE("read_file_bytes", "[asset][kinds]") {
    TempDir dir("media_engine_kinds");

    SECTION("reads the whole file") {
        auto path = dir.write("data.bin", std::string("\x01\x02\x00\x03", 4));
        auto bytes = read_file_bytes(path.string());
        REQUIRE(bytes.is_ok());
        REQUIRE(bytes.value() == std::vector<std::uint8_t>{1, 2, 0, 3});
    }

    SECTION("empty file") {
        auto path = dir.write("empty.bin", "");
        auto bytes = read_file_bytes(path.string());
        REQUIRE(bytes.is_ok());
        REQUIRE(bytes.value().empty());
    }

    SECTION("missing file") {
        auto bytes = read_file_bytes((dir.path() / "missing.bin").string());
        REQUIRE(bytes.is_err());
        REQUIRE(bytes.error().is<media_core::LookupError>());
    }
}

TEST_CASE("BytesAsset: load and unload", "[asset][kinds]") {
    TempDir dir("media_engine_kinds_bytes");
    auto path = dir.write("bytes/blob.dat", "abcdef");
    FakeDispatcher dispatcher;

    auto asset = std::make_shared<BytesAsset>(AssetDescriptor{"blob", "bytes", path.string()}, dispatcher);
    REQUIRE(asset->size() == 0);

    asset->load();
    complete_load(*asset);
    REQUIRE(asset->is_loaded());
    REQUIRE(asset->size() == 6);
    REQUIRE(asset->data().front() == 'a');

    REQUIRE(asset->unload().is_ok());
    REQUIRE(asset->size() == 0);
}

TEST_CASE("TextAsset: load and unload", "[asset][kinds]") {
    TempDir dir("media_engine_kinds_text");
    auto path = dir.write("texts/hello.txt", "hello world");
    FakeDispatcher dispatcher;

    auto asset = std::make_shared<TextAsset>(AssetDescriptor{"hello", "texts", path.string()}, dispatcher);

    asset->load();
    complete_load(*asset);
    REQUIRE(asset->text() == "hello world");

    REQUIRE(asset->unload().is_ok());
    REQUIRE(asset->text().empty());
}

TEST_CASE("TextAsset: missing file fails the decode", "[asset][kinds]") {
    FakeDispatcher dispatcher;
    auto asset = std::make_shared<TextAsset>(AssetDescriptor{"gone", "texts", "/nonexistent/gone.txt"}, dispatcher);

    asset->load();
    auto decoded = asset->decode();
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.error().is<media_core::LookupError>());
    REQUIRE(*decoded.error().get_context("asset") == "gone");
}

TEST_CASE("Built-in kinds: class registration", "[asset][kinds]") {
    auto bytes = BytesAsset::class_info();
    REQUIRE(bytes.attribute == "bytes");
    REQUIRE(bytes.group_config_section == "byte_groups");
    REQUIRE(bytes.matches_extension("x.BIN"));
    REQUIRE_FALSE(bytes.matches_extension("x.txt"));

    auto texts = TextAsset::class_info();
    REQUIRE(texts.attribute == "texts");
    REQUIRE(texts.priority > bytes.priority);
    REQUIRE(texts.matches_extension("config.yaml"));
}
