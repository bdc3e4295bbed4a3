/// @file test_shapes.cpp
/// @brief Tests for shape outlines and shape views

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

using namespace loom_ui;

// =============================================================================
// Outlines
// =============================================================================

TEST_CASE("Shape outlines", "[ui][shapes]") {
    const Rect bounds{0, 0, 40, 20};

    SECTION("rectangle and ellipse fill the bounds") {
        REQUIRE(Rectangle().path(bounds) == Path().add_rectangle(bounds));
        REQUIRE(Ellipse().path(bounds) == Path().add_ellipse(bounds));
    }

    SECTION("circle is centered on the shorter side") {
        REQUIRE(Circle().path(bounds) == Path().add_ellipse(Rect{10, 0, 20, 20}));
        REQUIRE(Circle().path(Rect{5, 5, 10, 30}) == Path().add_ellipse(Rect{5, 15, 10, 10}));
    }

    SECTION("corner radius is clamped to half the shorter side") {
        REQUIRE(rounded_rectangle_path(bounds, 50.0) == rounded_rectangle_path(bounds, 10.0));
        REQUIRE(rounded_rectangle_path(bounds, -3.0) == Path().add_rectangle(bounds));
        REQUIRE(RoundedRectangle(0).path(bounds) == Path().add_rectangle(bounds));

        const auto outline = RoundedRectangle(4).path(bounds);
        REQUIRE(outline.actions().size() == 10);
        REQUIRE(outline.actions().front() == PathAction{path_action::MoveTo{{4.0, 0.0}}});
        REQUIRE(outline.actions().back() == PathAction{path_action::Close{}});
    }

    SECTION("capsule has semicircular ends") {
        REQUIRE(Capsule().path(bounds) == rounded_rectangle_path(bounds, 10.0));
    }
}

// =============================================================================
// Shape views
// =============================================================================

TEST_CASE("Shape sizing", "[ui][shapes]") {
    HeadlessBackend backend;
    ViewGraph graph(Rectangle(), backend);

    REQUIRE(graph.update(SizeProposal::ideal(), true).size.size == Size{10, 10});

    const auto result = graph.update(SizeProposal{40, 30});
    REQUIRE(result.size.size == Size{40, 30});
    REQUIRE(result.size.ideal_size == Size{10, 10});
    REQUIRE(result.size.minimum_width == 0);
    REQUIRE_FALSE(result.size.maximum_height.has_value());

    SECTION("one axis proposed") {
        REQUIRE(graph.update(SizeProposal{40, std::nullopt}, true).size.size == Size{40, 10});
    }
}

TEST_CASE("Shape styling", "[ui][shapes]") {
    HeadlessBackend backend;

    SECTION("unstyled shapes use the foreground color") {
        ViewGraph graph(Circle(), backend);
        graph.update(SizeProposal{20, 20});
        const auto& widget = backend.widget(graph.root_widget());
        REQUIRE(widget.kind == HeadlessWidgetKind::PathWidget);
        REQUIRE(widget.fill == Color::black());
        REQUIRE_FALSE(widget.stroke.has_value());

        backend.set_color_scheme(ColorScheme::Dark);
        REQUIRE(backend.widget(graph.root_widget()).fill == Color::white());
    }

    SECTION("explicit fill") {
        ViewGraph graph(Rectangle().fill(Color::red()), backend);
        graph.update(SizeProposal{20, 20});
        REQUIRE(backend.widget(graph.root_widget()).fill == Color::red());
    }

    SECTION("stroke only") {
        ViewGraph graph(Ellipse().stroke(Color::red(), StrokeStyle{2.0}), backend);
        graph.update(SizeProposal{20, 20});
        const auto& widget = backend.widget(graph.root_widget());
        REQUIRE_FALSE(widget.fill.has_value());
        REQUIRE(widget.stroke == Color::red());
    }

    SECTION("environment foreground") {
        ViewGraph graph(AnyView(Rectangle()).foreground_color(Color::red()), backend);
        graph.update(SizeProposal{20, 20});
        const auto* path = find_first(backend, graph.root_widget(), HeadlessWidgetKind::PathWidget);
        REQUIRE(path != nullptr);
        REQUIRE(path->fill == Color::red());
    }
}

TEST_CASE("Shape paths are only rebuilt when the outline changes", "[ui][shapes]") {
    HeadlessBackend backend;
    {
        ViewGraph graph(RoundedRectangle(4), backend);
        graph.update(SizeProposal{40, 30});
        REQUIRE(backend.live_path_count() == 1);
        REQUIRE(backend.path_point_updates() == 1);

        graph.update(SizeProposal{40, 30});
        REQUIRE(backend.path_update_count() == 2);
        REQUIRE(backend.path_point_updates() == 1);
        REQUIRE(backend.widget(graph.root_widget()).path_renders == 2);

        graph.update(SizeProposal{50, 30});
        REQUIRE(backend.path_point_updates() == 2);

        // A new corner radius changes the outline at the same size
        graph.update(RoundedRectangle(6), SizeProposal{50, 30});
        REQUIRE(backend.path_point_updates() == 3);
    }
    REQUIRE(backend.live_path_count() == 0);
}
