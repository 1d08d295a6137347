// media_core BootHolds tests

#include <catch2/catch_test_macros.hpp>
#include <media_engine/core/boot.hpp>

using namespace media_core;

TEST_CASE("BootHolds: completes when every hold is cleared", "[core][boot]") {
    BootHolds boot;
    int ready = 0;
    boot.on_ready([&]() { ++ready; });

    boot.add_boot_hold("assets");
    boot.add_boot_hold("network");
    REQUIRE(boot.holds().size() == 2);
    REQUIRE_FALSE(boot.is_boot_complete());

    boot.clear_boot_hold("assets");
    REQUIRE_FALSE(boot.is_boot_complete());
    REQUIRE_FALSE(boot.is_held("assets"));
    REQUIRE(boot.is_held("network"));

    boot.clear_boot_hold("network");
    REQUIRE(boot.is_boot_complete());
    REQUIRE(ready == 1);

    SECTION("clearing again does nothing") {
        boot.clear_boot_hold("network");
        REQUIRE(ready == 1);
    }

    SECTION("holds added after completion are ignored") {
        boot.add_boot_hold("late");
        REQUIRE_FALSE(boot.is_held("late"));
        REQUIRE(boot.is_boot_complete());
    }
}

TEST_CASE("BootHolds: unknown hold is a no-op", "[core][boot]") {
    BootHolds boot;
    boot.add_boot_hold("assets");

    boot.clear_boot_hold("other");
    REQUIRE(boot.is_held("assets"));
    REQUIRE_FALSE(boot.is_boot_complete());
}

TEST_CASE("BootHolds: usable through BootGate", "[core][boot]") {
    BootHolds holds;
    holds.add_boot_hold("assets");

    BootGate& gate = holds;
    REQUIRE_FALSE(gate.is_boot_complete());
    gate.clear_boot_hold("assets");
    REQUIRE(gate.is_boot_complete());
}
