/// @file test_config.cpp
/// @brief Tests for engine configuration loading

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <loom/ui/config.hpp>
#include <loom/ui/headless_backend.hpp>

#include <string>

using namespace loom_ui;
using loom_core::ConfigError;
using loom_core::ErrorCode;
using Catch::Approx;

TEST_CASE("Default configuration file", "[ui][config]") {
    const std::string path = std::string(LOOM_TEST_CONFIG_DIR) + "/default.json";
    auto result = load_engine_config(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.environment.font.size == 12);
    REQUIRE(config.environment.color_scheme == ColorScheme::Light);
    REQUIRE(config.environment.layout_spacing == 10);
    REQUIRE(config.environment.dark_foreground == Color::white());
    // The shipped calibration matches the built-in one
    REQUIRE(config.calibration == BackendCalibration{});
    REQUIRE(config.logging.level == "info");
}

TEST_CASE("Partial documents keep defaults", "[ui][config]") {
    auto result = parse_engine_config(R"({
        "environment": { "color_scheme": "dark", "layout_spacing": 4 },
        "calibration": { "button_padding": [20, 10], "picker_natural_size_unavailable": true }
    })");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.environment.font.size == 12);
    REQUIRE(config.environment.layout_spacing == 4);
    REQUIRE(config.calibration.button_padding == Size{20, 10});
    REQUIRE(config.calibration.picker_natural_size_unavailable);
    REQUIRE(config.calibration.picker_extra_width == 50);

    SECTION("default environment picks the scheme's foreground") {
        const auto env = config.default_environment();
        REQUIRE(env.color_scheme() == ColorScheme::Dark);
        REQUIRE(env.foreground_color() == Color::white());
        REQUIRE(env.layout_spacing() == 4);
    }

    SECTION("headless options follow the configuration") {
        const auto options = HeadlessOptions::from_config(config);
        REQUIRE(options.color_scheme == ColorScheme::Dark);
        REQUIRE(options.calibration.button_padding == Size{20, 10});
    }
}

TEST_CASE("Colors as hex strings and arrays", "[ui][config]") {
    auto result = parse_engine_config(R"({
        "environment": { "light_foreground": "#FF000080", "dark_foreground": [0.0, 0.5, 1.0] }
    })");
    REQUIRE(result.is_ok());

    const auto& env = result.value().environment;
    REQUIRE(env.light_foreground.r == Approx(1.0f));
    REQUIRE(env.light_foreground.a == Approx(0x80 / 255.0f));
    REQUIRE(env.dark_foreground.g == Approx(0.5f));
    REQUIRE(env.dark_foreground.a == Approx(1.0f));
}

TEST_CASE("Invalid configuration", "[ui][config]") {
    SECTION("malformed JSON") {
        auto result = parse_engine_config("{ \"environment\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative spacing") {
        auto result = parse_engine_config(R"({ "environment": { "layout_spacing": -2 } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "environment.layout_spacing");
    }

    SECTION("unknown color scheme") {
        auto result = parse_engine_config(R"({ "environment": { "color_scheme": "sepia" } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "environment.color_scheme");
    }

    SECTION("bad hex color") {
        auto result = parse_engine_config(R"({ "environment": { "light_foreground": "000000" } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "environment.light_foreground");
    }

    SECTION("hex color with non-hex digits") {
        auto result = parse_engine_config(R"({ "environment": { "light_foreground": "#12zz56" } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "environment.light_foreground");
    }

    SECTION("signed hex color") {
        auto result = parse_engine_config(R"({ "environment": { "dark_foreground": "#-12345" } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().as<ConfigError>()->key == "environment.dark_foreground");
    }

    SECTION("unknown log level") {
        auto result = parse_engine_config(R"({ "logging": { "level": "chatty" } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.level");
    }

    SECTION("unknown logger level") {
        auto result = parse_engine_config(R"({ "logging": { "loggers": { "loom.layout": "loud" } } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.loggers.loom.layout");
    }

    SECTION("wrong shape") {
        auto result = parse_engine_config(R"({ "calibration": { "button_padding": 3 } })");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("missing file") {
        auto result = load_engine_config(std::string(LOOM_TEST_CONFIG_DIR) + "/does_not_exist.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }
}

TEST_CASE("Per-logger level overrides", "[ui][config][log]") {
    auto result = parse_engine_config(R"({
        "logging": { "level": "warn", "loggers": { "loom.layout": "trace", "loom.overrides": "error" } }
    })");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.logging.loggers.size() == 2);
    REQUIRE(config.logging.loggers.at("loom.layout") == "trace");

    apply_logging(config);
    REQUIRE(loom_core::graph_logger()->level() == spdlog::level::warn);
    REQUIRE(loom_core::layout_logger()->level() == spdlog::level::trace);
    REQUIRE(loom_core::get_logger("loom.overrides")->level() == spdlog::level::err);

    apply_logging(EngineConfig::defaults());
    REQUIRE(loom_core::layout_logger()->level() == spdlog::level::info);
}
