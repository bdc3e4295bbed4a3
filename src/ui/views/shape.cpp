/// @file shape.cpp
/// @brief Shape views and the built-in shapes

#include <loom/ui/views/shape.hpp>

#include <loom/ui/children.hpp>

#include <algorithm>

namespace loom_ui {

namespace {

constexpr int k_default_shape_length = 10;

/// Backend path owned by a shape node and the outline last sent to it
class ShapeStorage : public ChildrenStorage {
public:
    explicit ShapeStorage(IBackend& backend) : m_backend(backend) {}

    void teardown() override {
        if (backend_path.is_valid()) {
            m_backend.destroy_path(backend_path);
            backend_path = PathHandle{};
        }
    }

    PathHandle backend_path;
    std::optional<Path> old_path;

private:
    IBackend& m_backend;
};

} // anonymous namespace

// =============================================================================
// Shape
// =============================================================================

ViewSize Shape::size_fitting(Size proposal) const {
    return ViewSize(proposal, Size{k_default_shape_length, k_default_shape_length}, 0, 0, std::nullopt, std::nullopt);
}

std::unique_ptr<ChildrenStorage> Shape::children(
    IBackend& backend, const NodeSnapshot* /*snapshot*/, const Environment& /*environment*/) const {
    return std::make_unique<ShapeStorage>(backend);
}

WidgetHandle Shape::as_widget(ChildrenStorage& children, IBackend& backend) const {
    auto& storage = storage_cast<ShapeStorage>(children);
    const auto widget = backend.create_path_widget();
    storage.backend_path = backend.create_path();
    storage.old_path.reset();
    return widget;
}

LayoutResult Shape::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& /*children*/, const SizeProposal& proposal,
    const Environment& /*environment*/, IBackend& /*backend*/) const {
    auto size = size_fitting(Size{proposal.width.value_or(k_default_shape_length),
                                  proposal.height.value_or(k_default_shape_length)});
    if (!proposal.width) {
        size.size.width = size.ideal_width_for_proposed_height;
    }
    if (!proposal.height) {
        size.size.height = size.ideal_height_for_proposed_width;
    }
    return LayoutResult::leaf_view(size);
}

void Shape::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& environment, IBackend& backend) const {
    auto& storage = storage_cast<ShapeStorage>(children);

    const Rect bounds{Point{}, layout.size.size};
    Path outline = path(bounds);
    const bool points_changed = !storage.old_path || *storage.old_path != outline;

    backend.update_path(storage.backend_path, outline, bounds, points_changed);
    storage.old_path = std::move(outline);

    backend.set_size(widget, layout.size.size);

    // Unstyled shapes take the foreground color
    const bool styled = m_fill || m_stroke;
    const auto fill = styled ? m_fill : std::optional<Color>(environment.foreground_color());
    backend.render_path(storage.backend_path, widget, fill, m_stroke, m_stroke_style);
}

// =============================================================================
// Built-in shapes
// =============================================================================

Path rounded_rectangle_path(Rect bounds, double radius) {
    const double x = bounds.x;
    const double y = bounds.y;
    const double w = bounds.width;
    const double h = bounds.height;
    const double r = std::clamp(radius, 0.0, std::min(w, h) / 2.0);

    if (r == 0.0) {
        return Path().add_rectangle(bounds);
    }

    return Path()
        .move_to({x + r, y})
        .line_to({x + w - r, y})
        .quad_curve_to({x + w, y}, {x + w, y + r})
        .line_to({x + w, y + h - r})
        .quad_curve_to({x + w, y + h}, {x + w - r, y + h})
        .line_to({x + r, y + h})
        .quad_curve_to({x, y + h}, {x, y + h - r})
        .line_to({x, y + r})
        .quad_curve_to({x, y}, {x + r, y})
        .close();
}

Path Rectangle::path(Rect bounds) const {
    return Path().add_rectangle(bounds);
}

Path RoundedRectangle::path(Rect bounds) const {
    return rounded_rectangle_path(bounds, m_corner_radius);
}

Path Ellipse::path(Rect bounds) const {
    return Path().add_ellipse(bounds);
}

Path Circle::path(Rect bounds) const {
    const int diameter = std::min(bounds.width, bounds.height);
    return Path().add_ellipse(Rect{
        bounds.x + (bounds.width - diameter) / 2,
        bounds.y + (bounds.height - diameter) / 2,
        diameter,
        diameter,
    });
}

Path Capsule::path(Rect bounds) const {
    return rounded_rectangle_path(bounds, std::min(bounds.width, bounds.height) / 2.0);
}

} // namespace loom_ui
