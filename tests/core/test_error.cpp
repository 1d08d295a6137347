// media_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <media_engine/core/error.hpp>
#include <string>
#include <vector>

using namespace media_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::IOError, "Disk gone");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.message() == "Disk gone");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("asset", "logo");
        auto* ctx = err.get_context("asset");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "logo");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ConfigError::duplicate_attribute") {
        Error err = ConfigError::duplicate_attribute("images");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.is<ConfigError>());
        REQUIRE(err.as<ConfigError>()->kind == ConfigError::Kind::DuplicateAttribute);
        REQUIRE(err.message().find("images") != std::string::npos);
    }

    SECTION("ConfigError::missing_key") {
        Error err = ConfigError::missing_key("logo", "load");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "load");
    }

    SECTION("LookupError::file_not_found") {
        Error err = LookupError::file_not_found("logo.png");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<LookupError>()->kind == LookupError::Kind::FileNotFound);
        REQUIRE(err.as<LookupError>()->name == "logo.png");
    }

    SECTION("StateError::load_in_progress") {
        Error err = StateError::load_in_progress("logo");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.as<StateError>() != nullptr);
        REQUIRE(err.as<ConfigError>() == nullptr);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = LookupError::file_not_found("intro.txt");
    err.with_context("mode", "attract");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("[LookupError]") != std::string::npos);
    REQUIRE(chain.find("intro.txt") != std::string::npos);
    REQUIRE(chain.find("mode: attract") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(ConfigError::missing_key("a", "load"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 2);
    auto summary = debug::error_stats_summary();
    REQUIRE(summary.find("Config: 1") != std::string::npos);
    REQUIRE(summary.find("Generic: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void from error kind") {
        Result<void> r = Err(StateError::shut_down("loader"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidState);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("and_then on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "bad"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("Result with byte buffers", "[core][result]") {
    Result<std::vector<std::uint8_t>> r = Ok(std::vector<std::uint8_t>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r->size() == 3);
}
