// media_core config and string helper tests

#include <catch2/catch_test_macros.hpp>
#include <media_engine/core/config.hpp>
#include <media_engine/core/log.hpp>
#include <media_engine/core/strings.hpp>

#include <filesystem>
#include <fstream>
#include <map>

using namespace media_core;
namespace fs = std::filesystem;

TEST_CASE("String helpers", "[core][strings]") {
    SECTION("to_lower and iequals") {
        REQUIRE(to_lower("Logo.PNG") == "logo.png");
        REQUIRE(iequals("Attract", "attract"));
        REQUIRE_FALSE(iequals("attract", "attracts"));
    }

    SECTION("trim") {
        REQUIRE(trim("  hello \t") == "hello");
        REQUIRE(trim("   ").empty());
    }

    SECTION("split_list") {
        auto items = split_list("a, b c,,d");
        REQUIRE(items == std::vector<std::string>{"a", "b", "c", "d"});
        REQUIRE(split_list("").empty());
    }

    SECTION("case-insensitive map keys") {
        std::map<std::string, int, CaseInsensitiveLess> m;
        m["Logo"] = 1;
        REQUIRE(m.count("logo") == 1);
        REQUIRE(m.count("LOGO") == 1);
    }
}

TEST_CASE("JSON helpers", "[core][config]") {
    SECTION("parse_json") {
        auto ok = parse_json(R"({"load": "preload"})");
        REQUIRE(ok.is_ok());
        REQUIRE((*ok)["load"] == "preload");

        auto bad = parse_json("{ not json", "broken.json");
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code() == ErrorCode::ParseError);
        REQUIRE(bad.error().message().find("broken.json") != std::string::npos);
    }

    SECTION("merge_json replaces top-level keys") {
        nlohmann::json base = {{"load", "on_demand"}, {"priority", 0}};
        merge_json(base, {{"load", "preload"}, {"file", "a.txt"}});
        REQUIRE(base["load"] == "preload");
        REQUIRE(base["priority"] == 0);
        REQUIRE(base["file"] == "a.txt");

        merge_json(base, nlohmann::json::array());
        REQUIRE(base.size() == 3);
    }

    SECTION("json_value_or") {
        nlohmann::json j = {{"priority", 5}, {"name", "logo"}};
        REQUIRE(json_value_or<int>(j, "priority", 0) == 5);
        REQUIRE(json_value_or<int>(j, "missing", 7) == 7);
        REQUIRE(json_value_or<int>(j, "name", 3) == 3);
        REQUIRE(json_value_or<int>(nlohmann::json::array(), "priority", 1) == 1);
    }
}

TEST_CASE("load_json_file", "[core][config]") {
    auto path = fs::temp_directory_path() / "media_engine_test_config.json";

    SECTION("missing file") {
        fs::remove(path);
        auto result = load_json_file(path.string());
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<LookupError>());
    }

    SECTION("valid file") {
        {
            std::ofstream out(path);
            out << R"({"log_level": "debug", "modes": []})";
        }
        auto result = load_json_file(path.string());
        REQUIRE(result.is_ok());
        REQUIRE((*result)["log_level"] == "debug");
        fs::remove(path);
    }
}

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");

    REQUIRE(asset_logger()->name() == "assets");
    REQUIRE(loader_logger()->name() == "asset_loader");
}
