/// @file test_scroll_view.cpp
/// @brief Tests for scroll view overflow handling

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

using namespace loom_ui;

TEST_CASE("Content that fits has no scroll bars", "[ui][scroll]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    ViewGraph graph(ScrollView({TaggedView("a", log, Size{40, 20})}), backend);
    const auto result = graph.update(SizeProposal{200, 100});

    REQUIRE(result.size.size == Size{40, 100});
    REQUIRE(result.size.ideal_size == Size{40, 20});
    REQUIRE_FALSE(result.size.maximum_height.has_value());

    const auto& scroll = backend.widget(graph.root_widget());
    REQUIRE(scroll.kind == HeadlessWidgetKind::ScrollContainer);
    REQUIRE_FALSE(scroll.has_vertical_scroll_bar);
    REQUIRE_FALSE(scroll.has_horizontal_scroll_bar);
    REQUIRE(scroll_bar_state(graph.root_node().children()).vertical == false);
}

TEST_CASE("Vertical overflow adds a scroll bar", "[ui][scroll]") {
    HeadlessBackend backend;

    ViewGraph graph(
        ScrollView({FlexView({50, 0, std::nullopt}, {300, 300, 300})}),
        backend);
    const auto result = graph.update(SizeProposal{200, 100});

    const auto& scroll = backend.widget(graph.root_widget());
    REQUIRE(scroll.has_vertical_scroll_bar);
    REQUIRE_FALSE(scroll.has_horizontal_scroll_bar);
    REQUIRE(scroll_bar_state(graph.root_node().children()).vertical);

    // Viewport height is the proposal; content is laid out at full height
    REQUIRE(result.size.size.height == 100);
    REQUIRE(result.size.minimum_height == 0);
    REQUIRE(result.child_results.front().size.size == Size{188, 300});

    SECTION("content is narrowed by the bar and centered in the clip area") {
        REQUIRE(result.size.size.width == 212);
        const auto& inner = backend.widget(scroll.children.front());
        REQUIRE(inner.size == Size{200, 300});
        REQUIRE(inner.positions.front() == Point{6, 0});
    }

    SECTION("growing the viewport removes the bar") {
        graph.update(SizeProposal{200, 400});
        REQUIRE_FALSE(backend.widget(graph.root_widget()).has_vertical_scroll_bar);
    }
}

TEST_CASE("Horizontal scrolling", "[ui][scroll]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    ViewGraph graph(
        ScrollView({TaggedView("wide", log, Size{500, 20})}, Axes::horizontal_only()),
        backend);
    const auto result = graph.update(SizeProposal{200, 100});

    const auto& scroll = backend.widget(graph.root_widget());
    REQUIRE(scroll.has_horizontal_scroll_bar);
    REQUIRE_FALSE(scroll.has_vertical_scroll_bar);
    // Height follows the content plus the bar
    REQUIRE(result.size.size == Size{200, 32});
}

TEST_CASE("Scroll view teardown releases the inner container", "[ui][scroll][lifecycle]") {
    HeadlessBackend backend;
    {
        ViewGraph graph(ScrollView({Text("a"), Text("b")}), backend);
        graph.update(SizeProposal{100, 100});
        REQUIRE(backend.live_widget_count() == 5);
    }
    REQUIRE(backend.live_widget_count() == 0);
}
