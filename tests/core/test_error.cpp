// loom_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <loom/core/error.hpp>
#include <string>
#include <vector>

using namespace loom_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("path", "ui/state.json");
        auto* ctx = err.get_context("path");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "ui/state.json");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error kinds map to codes", "[core][error]") {
    SECTION("ResourceError::not_found") {
        Error err = ResourceError::not_found("icons/missing.png");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<ResourceError>());
        REQUIRE(err.message().find("icons/missing.png") != std::string::npos);
    }

    SECTION("ResourceError::unreadable") {
        Error err = ResourceError::unreadable("a.png", "truncated");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.as<ResourceError>()->kind == ResourceError::Kind::Unreadable);
    }

    SECTION("ResourceError::malformed") {
        Error err = ResourceError::malformed("memory", "unknown image type");
        REQUIRE(err.code() == ErrorCode::ParseError);
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("environment.layout_spacing", "must not be negative");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ConfigError>()->key == "environment.layout_spacing");
    }

    SECTION("GraphError::snapshot_mismatch") {
        Error err = GraphError::snapshot_mismatch("Counter", "Gallery");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message().find("Counter") != std::string::npos);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = ConfigError::malformed("unexpected end of input");
    err.with_context("path", "config/broken.json");

    const auto chain = build_error_chain(err);
    REQUIRE(chain.find("[ParseError]") != std::string::npos);
    REQUIRE(chain.find("[ConfigError]") != std::string::npos);
    REQUIRE(chain.find("path: config/broken.json") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    debug::record_error(ResourceError::not_found("x.png"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 2);
    REQUIRE(debug::error_stats_summary().find("Resource: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

TEST_CASE("Contract violations throw", "[core][error]") {
    REQUIRE_THROWS_AS(contract_violation("storage of the wrong kind"), ContractViolation);

    try {
        contract_violation("re-entrant update");
    } catch (const std::logic_error& ex) {
        REQUIRE(std::string(ex.what()) == "re-entrant update");
    }
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
        Result<void> r = Err(ResourceError::unreadable("out.json", "cannot open for writing"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::IOError);
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
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        auto values = std::move(r).value();
        REQUIRE(values.size() == 3);
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
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "gone"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }
}
