#pragma once

/// @file types.hpp
/// @brief Core value types for loom_ui
///
/// All geometry is in integer pixels.

#include "fwd.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <string>

namespace loom_ui {

// =============================================================================
// Color
// =============================================================================

/// RGBA color (0.0-1.0 range)
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r_, float g_, float b_, float a_ = 1.0f)
        : r(r_), g(g_), b(b_), a(a_) {}

    /// Create from 0-255 integer values
    static constexpr Color from_rgb8(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255) {
        return Color{r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
    }

    /// Create from hex value (0xRRGGBB or 0xRRGGBBAA)
    static constexpr Color from_hex(std::uint32_t hex) {
        if (hex > 0xFFFFFF) {
            return Color{
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f,
            };
        }
        return Color{
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f,
        };
    }

    [[nodiscard]] constexpr std::array<float, 4> to_array() const {
        return {r, g, b, a};
    }

    [[nodiscard]] constexpr Color with_alpha(float new_alpha) const {
        return Color{r, g, b, new_alpha};
    }

    constexpr bool operator==(const Color&) const = default;

    static constexpr Color white() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
    static constexpr Color black() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
    static constexpr Color red() { return {1.0f, 0.0f, 0.0f, 1.0f}; }
    static constexpr Color green() { return {0.0f, 1.0f, 0.0f, 1.0f}; }
    static constexpr Color blue() { return {0.0f, 0.0f, 1.0f, 1.0f}; }
    static constexpr Color gray() { return {0.5f, 0.5f, 0.5f, 1.0f}; }
    static constexpr Color transparent() { return {0.0f, 0.0f, 0.0f, 0.0f}; }
};

// =============================================================================
// Geometry
// =============================================================================

/// 2D point
struct Point {
    int x = 0;
    int y = 0;

    constexpr Point() = default;
    constexpr Point(int x_, int y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& other) const { return {x + other.x, y + other.y}; }
    constexpr Point operator-(const Point& other) const { return {x - other.x, y - other.y}; }
    constexpr bool operator==(const Point&) const = default;
};

/// 2D size
struct Size {
    int width = 0;
    int height = 0;

    constexpr Size() = default;
    constexpr Size(int w, int h) : width(w), height(h) {}

    constexpr Size operator+(const Size& other) const { return {width + other.width, height + other.height}; }
    constexpr bool operator==(const Size&) const = default;

    static constexpr Size zero() { return {0, 0}; }
};

/// Rectangle
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    constexpr Rect() = default;
    constexpr Rect(int x_, int y_, int w, int h) : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point origin, Size size) : x(origin.x), y(origin.y), width(size.width), height(size.height) {}

    [[nodiscard]] constexpr Point origin() const { return {x, y}; }
    [[nodiscard]] constexpr Size size() const { return {width, height}; }
    constexpr bool operator==(const Rect&) const = default;
};

/// Edge insets, in the order CSS uses for padding
struct EdgeInsets {
    int top = 0;
    int leading = 0;
    int bottom = 0;
    int trailing = 0;

    constexpr EdgeInsets() = default;
    constexpr EdgeInsets(int t, int l, int b, int r) : top(t), leading(l), bottom(b), trailing(r) {}

    static constexpr EdgeInsets all(int value) { return {value, value, value, value}; }
    static constexpr EdgeInsets symmetric(int horizontal, int vertical) {
        return {vertical, horizontal, vertical, horizontal};
    }

    /// Sum of leading and trailing insets
    [[nodiscard]] constexpr int horizontal() const { return leading + trailing; }
    /// Sum of top and bottom insets
    [[nodiscard]] constexpr int vertical() const { return top + bottom; }

    constexpr bool operator==(const EdgeInsets&) const = default;
};

// =============================================================================
// Orientation & Alignment
// =============================================================================

/// Layout orientation
enum class Orientation : std::uint8_t {
    Horizontal,
    Vertical,
};

[[nodiscard]] constexpr Orientation perpendicular(Orientation orientation) {
    return orientation == Orientation::Horizontal ? Orientation::Vertical : Orientation::Horizontal;
}

/// Set of axes a view acts on (scroll views, fixed size)
struct Axes {
    bool horizontal = false;
    bool vertical = false;

    static constexpr Axes none() { return {false, false}; }
    static constexpr Axes horizontal_only() { return {true, false}; }
    static constexpr Axes vertical_only() { return {false, true}; }
    static constexpr Axes both() { return {true, true}; }

    [[nodiscard]] constexpr bool contains(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? horizontal : vertical;
    }

    constexpr bool operator==(const Axes&) const = default;
};

/// Cross-axis alignment used by stacks. For a vertical stack leading is the
/// left edge; for a horizontal stack it is the top edge.
enum class StackAlignment : std::uint8_t {
    Leading,
    Center,
    Trailing,
};

enum class HorizontalAlignment : std::uint8_t {
    Leading,
    Center,
    Trailing,
};

enum class VerticalAlignment : std::uint8_t {
    Top,
    Center,
    Bottom,
};

/// Position factor of an alignment: 0 for leading, 0.5 for center, 1 for trailing
[[nodiscard]] constexpr double alignment_factor(StackAlignment alignment) {
    switch (alignment) {
        case StackAlignment::Leading: return 0.0;
        case StackAlignment::Center: return 0.5;
        case StackAlignment::Trailing: return 1.0;
    }
    return 0.5;
}

[[nodiscard]] constexpr double alignment_factor(HorizontalAlignment alignment) {
    switch (alignment) {
        case HorizontalAlignment::Leading: return 0.0;
        case HorizontalAlignment::Center: return 0.5;
        case HorizontalAlignment::Trailing: return 1.0;
    }
    return 0.5;
}

[[nodiscard]] constexpr double alignment_factor(VerticalAlignment alignment) {
    switch (alignment) {
        case VerticalAlignment::Top: return 0.0;
        case VerticalAlignment::Center: return 0.5;
        case VerticalAlignment::Bottom: return 1.0;
    }
    return 0.5;
}

/// Two-dimensional alignment used by frames and overlays
struct Alignment {
    HorizontalAlignment horizontal = HorizontalAlignment::Center;
    VerticalAlignment vertical = VerticalAlignment::Center;

    static constexpr Alignment center() { return {}; }
    static constexpr Alignment top_leading() { return {HorizontalAlignment::Leading, VerticalAlignment::Top}; }
    static constexpr Alignment top() { return {HorizontalAlignment::Center, VerticalAlignment::Top}; }
    static constexpr Alignment leading() { return {HorizontalAlignment::Leading, VerticalAlignment::Center}; }
    static constexpr Alignment trailing() { return {HorizontalAlignment::Trailing, VerticalAlignment::Center}; }
    static constexpr Alignment bottom_trailing() { return {HorizontalAlignment::Trailing, VerticalAlignment::Bottom}; }

    /// Offset of a child of `child` size placed inside `container`
    [[nodiscard]] Point position(Size container, Size child) const {
        return Point{
            static_cast<int>(std::lround((container.width - child.width) * alignment_factor(horizontal))),
            static_cast<int>(std::lround((container.height - child.height) * alignment_factor(vertical))),
        };
    }

    constexpr bool operator==(const Alignment&) const = default;
};

// =============================================================================
// Text
// =============================================================================

enum class FontWeight : std::uint8_t {
    Regular,
    Medium,
    Bold,
};

/// Font description resolved by the backend
struct Font {
    std::string family = "system";
    int size = 12;
    FontWeight weight = FontWeight::Regular;

    bool operator==(const Font&) const = default;

    static Font system(int size, FontWeight weight = FontWeight::Regular) {
        return Font{"system", size, weight};
    }
};

/// Platform color scheme
enum class ColorScheme : std::uint8_t {
    Light,
    Dark,
};

[[nodiscard]] constexpr const char* to_string(ColorScheme scheme) {
    return scheme == ColorScheme::Dark ? "dark" : "light";
}

} // namespace loom_ui
