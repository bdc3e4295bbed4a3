#pragma once

/// @file config.hpp
/// @brief Engine configuration loaded from JSON
///
/// Example document:
/// @code
/// {
///   "environment": {
///     "font": { "family": "system", "size": 13, "weight": "regular" },
///     "color_scheme": "dark",
///     "layout_spacing": 8,
///     "light_foreground": [0.0, 0.0, 0.0, 1.0],
///     "dark_foreground": [1.0, 1.0, 1.0, 1.0]
///   },
///   "calibration": { "button_padding": [24, 13], "picker_extra_width": 50 },
///   "logging": { "level": "debug", "directory": "logs", "loggers": { "loom.layout": "trace" } }
/// }
/// @endcode

#include "environment.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>
#include <loom/core/log.hpp>

#include <map>
#include <string>

namespace loom_ui {

// =============================================================================
// BackendCalibration
// =============================================================================

/// Per-widget-kind size corrections for backends whose natural size queries
/// return degenerate values before the first render. These numbers depend on
/// the toolkit and theme version and should be re-measured per platform.
struct BackendCalibration {
    /// Added to a button label's text size
    Size button_padding{24, 13};
    /// Added to the widest picker option
    int picker_extra_width = 50;
    /// Added to the picker's line height
    int picker_vertical_padding = 12;
    int picker_minimum_height = 32;
    /// The picker reports (-1, -1) until it has been realized
    bool picker_natural_size_unavailable = false;
    Size progress_spinner_size{16, 16};
    int progress_bar_height = 6;

    bool operator==(const BackendCalibration&) const = default;
};

// =============================================================================
// EngineConfig
// =============================================================================

struct EnvironmentConfig {
    Font font;
    ColorScheme color_scheme = ColorScheme::Light;
    int layout_spacing = 10;
    Color light_foreground = Color::black();
    Color dark_foreground = Color::white();
};

struct LoggingConfig {
    std::string level = "info";
    std::string directory;
    /// Per-logger level overrides, e.g. `"loom.layout": "debug"`
    std::map<std::string, std::string> loggers;
};

/// Full engine configuration
struct EngineConfig {
    EnvironmentConfig environment;
    BackendCalibration calibration;
    LoggingConfig logging;

    /// Built-in configuration
    [[nodiscard]] static EngineConfig defaults() { return EngineConfig{}; }

    /// Environment a backend starts from when computing its root environment
    [[nodiscard]] Environment default_environment() const;

    /// Logging options derived from the `logging` section
    [[nodiscard]] loom_core::LogConfig log_config() const;
};

/// Parse a configuration document; missing keys keep their defaults
[[nodiscard]] loom_core::Result<EngineConfig> parse_engine_config(const std::string& json_text);

/// Load a configuration file
[[nodiscard]] loom_core::Result<EngineConfig> load_engine_config(const std::string& path);

/// Apply the `logging` section to the logger registry
void apply_logging(const EngineConfig& config);

} // namespace loom_ui
