/// @file config.cpp
/// @brief Engine configuration loading

#include <loom/ui/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace loom_ui {

using loom_core::ConfigError;
using loom_core::Err;
using loom_core::Ok;
using loom_core::Result;

namespace {

/// Thrown inside the parser, converted to a ConfigError at the boundary
struct InvalidValue {
    std::string key;
    std::string reason;
};

Color parse_color(const nlohmann::json& value, const std::string& key) {
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.size() != 7 && text.size() != 9) {
            throw InvalidValue{key, "expected #RRGGBB or #RRGGBBAA"};
        }
        if (text[0] != '#') {
            throw InvalidValue{key, "hex colors start with '#'"};
        }
        const bool all_hex = std::all_of(text.begin() + 1, text.end(),
            [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
        if (!all_hex) {
            throw InvalidValue{key, "not a hex number"};
        }
        std::size_t consumed = 0;
        const auto hex = static_cast<std::uint32_t>(std::stoul(text.substr(1), &consumed, 16));
        if (consumed != text.size() - 1) {
            throw InvalidValue{key, "not a hex number"};
        }
        if (text.size() == 9) {
            return Color{
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f,
            };
        }
        return Color::from_hex(hex);
    }

    if (!value.is_array() || value.size() < 3) {
        throw InvalidValue{key, "expected [r, g, b] or [r, g, b, a]"};
    }
    Color c;
    c.r = value[0].get<float>();
    c.g = value[1].get<float>();
    c.b = value[2].get<float>();
    c.a = value.size() >= 4 ? value[3].get<float>() : 1.0f;
    return c;
}

Size parse_size(const nlohmann::json& value, const std::string& key) {
    if (!value.is_array() || value.size() != 2) {
        throw InvalidValue{key, "expected [width, height]"};
    }
    return Size{value[0].get<int>(), value[1].get<int>()};
}

FontWeight parse_weight(const std::string& text, const std::string& key) {
    if (text == "regular") return FontWeight::Regular;
    if (text == "medium") return FontWeight::Medium;
    if (text == "bold") return FontWeight::Bold;
    throw InvalidValue{key, "unknown weight '" + text + "'"};
}

ColorScheme parse_scheme(const std::string& text, const std::string& key) {
    if (text == "light") return ColorScheme::Light;
    if (text == "dark") return ColorScheme::Dark;
    throw InvalidValue{key, "expected 'light' or 'dark'"};
}

void parse_environment(const nlohmann::json& j, EnvironmentConfig& env) {
    if (j.contains("font")) {
        const auto& font = j["font"];
        env.font.family = font.value("family", env.font.family);
        env.font.size = font.value("size", env.font.size);
        if (font.contains("weight")) {
            env.font.weight = parse_weight(font["weight"].get<std::string>(), "environment.font.weight");
        }
        if (env.font.size <= 0) {
            throw InvalidValue{"environment.font.size", "must be positive"};
        }
    }
    if (j.contains("color_scheme")) {
        env.color_scheme = parse_scheme(j["color_scheme"].get<std::string>(), "environment.color_scheme");
    }
    env.layout_spacing = j.value("layout_spacing", env.layout_spacing);
    if (env.layout_spacing < 0) {
        throw InvalidValue{"environment.layout_spacing", "must not be negative"};
    }
    if (j.contains("light_foreground")) {
        env.light_foreground = parse_color(j["light_foreground"], "environment.light_foreground");
    }
    if (j.contains("dark_foreground")) {
        env.dark_foreground = parse_color(j["dark_foreground"], "environment.dark_foreground");
    }
}

void parse_calibration(const nlohmann::json& j, BackendCalibration& cal) {
    if (j.contains("button_padding")) {
        cal.button_padding = parse_size(j["button_padding"], "calibration.button_padding");
    }
    cal.picker_extra_width = j.value("picker_extra_width", cal.picker_extra_width);
    cal.picker_vertical_padding = j.value("picker_vertical_padding", cal.picker_vertical_padding);
    cal.picker_minimum_height = j.value("picker_minimum_height", cal.picker_minimum_height);
    cal.picker_natural_size_unavailable =
        j.value("picker_natural_size_unavailable", cal.picker_natural_size_unavailable);
    if (j.contains("progress_spinner_size")) {
        cal.progress_spinner_size = parse_size(j["progress_spinner_size"], "calibration.progress_spinner_size");
    }
    cal.progress_bar_height = j.value("progress_bar_height", cal.progress_bar_height);
}

void parse_logging(const nlohmann::json& j, LoggingConfig& logging) {
    logging.level = j.value("level", logging.level);
    if (!loom_core::parse_log_level(logging.level)) {
        throw InvalidValue{"logging.level", "unknown level '" + logging.level + "'"};
    }
    logging.directory = j.value("directory", logging.directory);

    if (j.contains("loggers")) {
        const auto& loggers = j["loggers"];
        if (!loggers.is_object()) {
            throw InvalidValue{"logging.loggers", "expected an object of logger levels"};
        }
        for (auto it = loggers.begin(); it != loggers.end(); ++it) {
            const auto& level = it.value();
            const auto key = "logging.loggers." + it.key();
            if (!level.is_string() || !loom_core::parse_log_level(level.get<std::string>())) {
                throw InvalidValue{key, "unknown level"};
            }
            logging.loggers[it.key()] = level.get<std::string>();
        }
    }
}

} // anonymous namespace

// =============================================================================
// EngineConfig
// =============================================================================

Environment EngineConfig::default_environment() const {
    EnvironmentValues values;
    values.font = environment.font;
    values.color_scheme = environment.color_scheme;
    values.layout_spacing = environment.layout_spacing;
    values.foreground_color = environment.color_scheme == ColorScheme::Dark
        ? environment.dark_foreground
        : environment.light_foreground;
    return Environment(std::move(values));
}

loom_core::LogConfig EngineConfig::log_config() const {
    loom_core::LogConfig config;
    config.level = loom_core::parse_log_level(logging.level).value_or(spdlog::level::info);
    config.file_enabled = !logging.directory.empty();
    config.log_directory = logging.directory;
    return config;
}

// =============================================================================
// Loading
// =============================================================================

Result<EngineConfig> parse_engine_config(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        return Err<EngineConfig>(ConfigError::malformed(ex.what()));
    }

    if (!j.is_object()) {
        return Err<EngineConfig>(ConfigError::invalid_value("<root>", "expected an object"));
    }

    EngineConfig config;
    try {
        if (j.contains("environment")) {
            parse_environment(j["environment"], config.environment);
        }
        if (j.contains("calibration")) {
            parse_calibration(j["calibration"], config.calibration);
        }
        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }
    } catch (const InvalidValue& invalid) {
        return Err<EngineConfig>(ConfigError::invalid_value(invalid.key, invalid.reason));
    } catch (const nlohmann::json::exception& ex) {
        return Err<EngineConfig>(ConfigError::invalid_value("<document>", ex.what()));
    }

    return Ok(std::move(config));
}

Result<EngineConfig> load_engine_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<EngineConfig>(ConfigError::unreadable(path));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto result = parse_engine_config(contents.str());
    if (result.is_err()) {
        result.error().with_context("path", path);
        loom_core::debug::record_error(result.error());
    }
    return result;
}

void apply_logging(const EngineConfig& config) {
    const auto log_config = config.log_config();
    loom_core::configure_logging(log_config);

    for (const auto& [name, level_name] : config.logging.loggers) {
        const auto level = loom_core::parse_log_level(level_name).value_or(log_config.level);
        // Created first so the override is not lost to a later lookup
        loom_core::get_logger(name);
        loom_core::set_logger_level(name, level);
    }

    loom_core::core_logger()->debug("Logging configured at level '{}' with {} logger overrides",
                                    loom_core::log_level_name(log_config.level),
                                    config.logging.loggers.size());
}

} // namespace loom_ui
