#pragma once

/// @file shape.hpp
/// @brief Vector shapes drawn through backend paths
///
/// A shape describes its outline with `path()`; the shape view keeps one
/// backend path per node and only resends the points when the outline
/// changes. Without explicit styling a shape is filled with the
/// environment's foreground color.
///
/// @code
/// RoundedRectangle(8).fill(Color::blue()).frame(120, 40)
/// Circle().stroke(Color::red(), StrokeStyle{2.0})
/// @endcode

#include <loom/ui/path.hpp>
#include <loom/ui/view.hpp>

#include <optional>

namespace loom_ui {

// =============================================================================
// Shape
// =============================================================================

class Shape : public View {
public:
    /// Outline of the shape inside `bounds`
    [[nodiscard]] virtual Path path(Rect bounds) const = 0;

    /// Size for a concrete proposal. The default accepts the proposal with an
    /// ideal size of 10x10 and no maximum.
    [[nodiscard]] virtual ViewSize size_fitting(Size proposal) const;

    [[nodiscard]] const std::optional<Color>& fill_color() const noexcept { return m_fill; }
    [[nodiscard]] const std::optional<Color>& stroke_color() const noexcept { return m_stroke; }
    [[nodiscard]] const StrokeStyle& stroke_style() const noexcept { return m_stroke_style; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const final;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const final;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const final;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const final;

protected:
    Shape() = default;

    std::optional<Color> m_fill;
    std::optional<Color> m_stroke;
    StrokeStyle m_stroke_style;
};

/// Adds styling that keeps the concrete shape type
template<typename Derived>
class ShapeView : public Shape {
public:
    [[nodiscard]] Derived fill(Color color) const {
        Derived copy = static_cast<const Derived&>(*this);
        copy.m_fill = color;
        return copy;
    }

    [[nodiscard]] Derived stroke(Color color, StrokeStyle style = {}) const {
        Derived copy = static_cast<const Derived&>(*this);
        copy.m_stroke = color;
        copy.m_stroke_style = style;
        return copy;
    }
};

// =============================================================================
// Shapes
// =============================================================================

class Rectangle : public ShapeView<Rectangle> {
public:
    [[nodiscard]] std::string name() const override { return "Rectangle"; }
    [[nodiscard]] Path path(Rect bounds) const override;
};

class RoundedRectangle : public ShapeView<RoundedRectangle> {
public:
    explicit RoundedRectangle(double corner_radius) : m_corner_radius(corner_radius) {}

    [[nodiscard]] std::string name() const override { return "RoundedRectangle"; }
    [[nodiscard]] double corner_radius() const noexcept { return m_corner_radius; }
    [[nodiscard]] Path path(Rect bounds) const override;

private:
    double m_corner_radius;
};

class Ellipse : public ShapeView<Ellipse> {
public:
    [[nodiscard]] std::string name() const override { return "Ellipse"; }
    [[nodiscard]] Path path(Rect bounds) const override;
};

/// Largest circle centered in the bounds
class Circle : public ShapeView<Circle> {
public:
    [[nodiscard]] std::string name() const override { return "Circle"; }
    [[nodiscard]] Path path(Rect bounds) const override;
};

/// Rounded rectangle whose short sides are semicircles
class Capsule : public ShapeView<Capsule> {
public:
    [[nodiscard]] std::string name() const override { return "Capsule"; }
    [[nodiscard]] Path path(Rect bounds) const override;
};

/// Outline of a rectangle with corners rounded by `radius`, clamped to half
/// the shorter side
[[nodiscard]] Path rounded_rectangle_path(Rect bounds, double radius);

} // namespace loom_ui
