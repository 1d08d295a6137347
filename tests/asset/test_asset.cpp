/// @file test_asset.cpp
/// @brief Tests for the Asset load/unload state machine

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace media_asset;
using namespace media_asset::testing;

TEST_CASE("Asset: construction", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo", {{"priority", 7}, {"load", "preload"}});

    REQUIRE(asset->name() == "logo");
    REQUIRE(asset->class_id() == "tests");
    REQUIRE(asset->state() == LoadState::Unloaded);
    REQUIRE_FALSE(asset->is_unloading());
    REQUIRE(asset->priority() == 7);
    REQUIRE(asset->load_key() == "preload");

    SECTION("defaults") {
        auto plain = make_test_asset(dispatcher, "plain");
        REQUIRE(plain->priority() == 0);
        REQUIRE(plain->load_key() == load_keys::ON_DEMAND);
    }

    SECTION("creation ids increase") {
        auto later = make_test_asset(dispatcher, "later");
        REQUIRE(later->creation_id() > asset->creation_id());
    }
}

TEST_CASE("Asset: load queues an unloaded asset", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");

    int fired = 0;
    asset->load([&](Asset&) { ++fired; });

    REQUIRE(asset->is_loading());
    REQUIRE(dispatcher.enqueued.size() == 1);
    REQUIRE(dispatcher.enqueued[0] == asset);
    REQUIRE(fired == 0);
    REQUIRE(asset->pending_callbacks() == 1);

    SECTION("loading again queues again") {
        asset->load();
        REQUIRE(dispatcher.enqueued.size() == 2);
        REQUIRE(asset->is_loading());
    }

    SECTION("completion fires callbacks") {
        auto decoded = asset->decode();
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value());
        REQUIRE(asset->is_loading());

        REQUIRE(asset->mark_loaded());
        REQUIRE(asset->is_loaded());
        REQUIRE(fired == 1);
        REQUIRE(asset->pending_callbacks() == 0);
        REQUIRE(asset->loads.load() == 1);
    }

    SECTION("priority argument replaces stored priority") {
        asset->load({}, 12);
        REQUIRE(asset->priority() == 12);
    }
}

TEST_CASE("Asset: load requests go to the creating dispatcher", "[asset][state]") {
    FakeDispatcher first;
    FakeDispatcher second;
    auto a = make_test_asset(first, "a");
    auto b = make_test_asset(second, "b");

    a->load();
    b->load();

    REQUIRE(first.enqueued.size() == 1);
    REQUIRE(first.enqueued[0] == a);
    REQUIRE(second.enqueued.size() == 1);
    REQUIRE(second.enqueued[0] == b);
}

TEST_CASE("Asset: loading a loaded asset fires synchronously", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");
    asset->load();
    complete_load(*asset);
    REQUIRE(dispatcher.enqueued.size() == 1);

    int fired = 0;
    asset->load([&](Asset& a) {
        ++fired;
        REQUIRE(a.is_loaded());
    });

    REQUIRE(fired == 1);
    REQUIRE(dispatcher.enqueued.size() == 1);
    REQUIRE(asset->is_loaded());
}

TEST_CASE("Asset: owner token drops duplicate callbacks", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");
    int owner_token = 0;
    int fired = 0;

    asset->load([&](Asset&) { ++fired; }, std::nullopt, &owner_token);
    asset->load([&](Asset&) { ++fired; }, std::nullopt, &owner_token);
    asset->load([&](Asset&) { ++fired; });
    REQUIRE(asset->pending_callbacks() == 2);

    complete_load(*asset);
    REQUIRE(fired == 2);

    SECTION("token is free again once fired") {
        asset->load([&](Asset&) { ++fired; }, std::nullopt, &owner_token);
        REQUIRE(fired == 3);
    }
}

TEST_CASE("Asset: callbacks may request the asset again", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");
    int inner = 0;

    asset->load([&](Asset& a) {
        a.load([&](Asset&) { ++inner; });
    });
    complete_load(*asset);

    REQUIRE(inner == 1);
    REQUIRE(asset->pending_callbacks() == 0);
}

TEST_CASE("Asset: unload", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");

    SECTION("refused while loading") {
        asset->load();
        auto result = asset->unload();
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<media_core::StateError>());
        REQUIRE(asset->is_loading());
        REQUIRE(asset->unloads.load() == 0);
    }

    SECTION("releases a loaded asset") {
        asset->load();
        complete_load(*asset);

        REQUIRE(asset->unload().is_ok());
        REQUIRE(asset->state() == LoadState::Unloaded);
        REQUIRE_FALSE(asset->is_unloading());
        REQUIRE(asset->unloads.load() == 1);

        // Loads again from scratch
        asset->load();
        complete_load(*asset);
        REQUIRE(asset->is_loaded());
        REQUIRE(asset->loads.load() == 2);
    }

    SECTION("never-loaded asset is tolerated") {
        REQUIRE(asset->unload().is_ok());
        REQUIRE(asset->unloads.load() == 1);
        REQUIRE(asset->state() == LoadState::Unloaded);
    }
}

TEST_CASE("Asset: decode skips work it does not need", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");

    SECTION("not loading") {
        auto decoded = asset->decode();
        REQUIRE(decoded.is_ok());
        REQUIRE_FALSE(decoded.value());
        REQUIRE(asset->loads.load() == 0);
    }

    SECTION("already decoded") {
        asset->load();
        asset->load();
        REQUIRE(asset->decode().value());
        REQUIRE_FALSE(asset->decode().value());
        REQUIRE(asset->loads.load() == 1);
    }
}

TEST_CASE("Asset: stale completions are ignored", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");

    SECTION("completion before decode") {
        asset->load();
        REQUIRE_FALSE(asset->mark_loaded());
        REQUIRE(asset->is_loading());
    }

    SECTION("duplicate entry completing after the asset loaded") {
        asset->load();
        asset->load();  // second queue entry
        complete_load(*asset);

        auto decoded = asset->decode();
        REQUIRE(decoded.is_ok());
        REQUIRE_FALSE(decoded.value());
        REQUIRE_FALSE(asset->mark_loaded());
        REQUIRE(asset->is_loaded());
        REQUIRE(asset->loads.load() == 1);
    }

    SECTION("entry from before an unload completes ahead of the new request") {
        asset->load();
        complete_load(*asset);
        REQUIRE(asset->unload().is_ok());

        int fired = 0;
        asset->load([&](Asset&) { ++fired; });

        // An old completion arrives before the new request is decoded
        REQUIRE_FALSE(asset->mark_loaded());
        REQUIRE(asset->is_loading());
        REQUIRE(fired == 0);

        complete_load(*asset);
        REQUIRE(asset->is_loaded());
        REQUIRE(fired == 1);
    }

    SECTION("completion for an asset that is not loading") {
        REQUIRE_FALSE(asset->mark_loaded());
        REQUIRE(asset->state() == LoadState::Unloaded);
    }
}

TEST_CASE("Asset: decode failure carries the asset name", "[asset][state]") {
    FakeDispatcher dispatcher;
    auto asset = make_test_asset(dispatcher, "logo");
    asset->mode = TestAsset::Mode::Fail;

    asset->load();
    auto decoded = asset->decode();
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.error().code() == media_core::ErrorCode::IOError);
    auto* name = decoded.error().get_context("asset");
    REQUIRE(name != nullptr);
    REQUIRE(*name == "logo");

    REQUIRE(asset->is_loading());
    REQUIRE_FALSE(asset->mark_loaded());
}
