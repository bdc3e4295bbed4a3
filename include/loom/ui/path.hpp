#pragma once

/// @file path.hpp
/// @brief Vector path geometry rendered by shape views

#include "types.hpp"

#include <variant>
#include <vector>

namespace loom_ui {

/// Point with sub-pixel precision
struct PathPoint {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const PathPoint&) const = default;
};

namespace path_action {

struct MoveTo {
    PathPoint point;
    bool operator==(const MoveTo&) const = default;
};

struct LineTo {
    PathPoint point;
    bool operator==(const LineTo&) const = default;
};

struct QuadCurve {
    PathPoint control;
    PathPoint end;
    bool operator==(const QuadCurve&) const = default;
};

struct CubicCurve {
    PathPoint control1;
    PathPoint control2;
    PathPoint end;
    bool operator==(const CubicCurve&) const = default;
};

struct AddRectangle {
    Rect rect;
    bool operator==(const AddRectangle&) const = default;
};

struct AddEllipse {
    Rect bounds;
    bool operator==(const AddEllipse&) const = default;
};

struct Close {
    bool operator==(const Close&) const = default;
};

} // namespace path_action

using PathAction = std::variant<
    path_action::MoveTo,
    path_action::LineTo,
    path_action::QuadCurve,
    path_action::CubicCurve,
    path_action::AddRectangle,
    path_action::AddEllipse,
    path_action::Close>;

/// Stroke style
struct StrokeStyle {
    double width = 1.0;

    bool operator==(const StrokeStyle&) const = default;
};

/// A sequence of drawing actions. Equality compares the actions, which is how
/// shape views decide whether backend path geometry must be rebuilt.
class Path {
public:
    Path() = default;

    Path& move_to(PathPoint point) { m_actions.emplace_back(path_action::MoveTo{point}); return *this; }
    Path& line_to(PathPoint point) { m_actions.emplace_back(path_action::LineTo{point}); return *this; }
    Path& quad_curve_to(PathPoint control, PathPoint end) {
        m_actions.emplace_back(path_action::QuadCurve{control, end});
        return *this;
    }
    Path& cubic_curve_to(PathPoint control1, PathPoint control2, PathPoint end) {
        m_actions.emplace_back(path_action::CubicCurve{control1, control2, end});
        return *this;
    }
    Path& add_rectangle(Rect rect) { m_actions.emplace_back(path_action::AddRectangle{rect}); return *this; }
    Path& add_ellipse(Rect bounds) { m_actions.emplace_back(path_action::AddEllipse{bounds}); return *this; }
    Path& close() { m_actions.emplace_back(path_action::Close{}); return *this; }

    [[nodiscard]] const std::vector<PathAction>& actions() const noexcept { return m_actions; }
    [[nodiscard]] bool empty() const noexcept { return m_actions.empty(); }

    bool operator==(const Path&) const = default;

private:
    std::vector<PathAction> m_actions;
};

} // namespace loom_ui
