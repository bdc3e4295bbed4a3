/// @file test_modifiers.cpp
/// @brief Tests for layout and lifecycle modifiers

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

using namespace loom_ui;

namespace {

/// Lay out `view` as the root of a fresh graph
LayoutResult layout_root(HeadlessBackend& backend, std::unique_ptr<ViewGraph>& graph, AnyView view,
                         SizeProposal proposal) {
    graph = std::make_unique<ViewGraph>(std::move(view), backend);
    return graph->update(proposal);
}

} // namespace

TEST_CASE("Padding", "[ui][modifiers]") {
    HeadlessBackend backend;
    std::unique_ptr<ViewGraph> graph;
    auto log = std::make_shared<std::vector<std::string>>();

    SECTION("uniform") {
        const auto result = layout_root(backend, graph, AnyView(TaggedView("a", log)).padding(5), SizeProposal{100, 100});
        REQUIRE(result.size.size == Size{30, 20});
        REQUIRE(result.size.minimum_width == 30);
        REQUIRE(result.size.maximum_height == 20);
        const auto& container = backend.widget(graph->root_widget());
        REQUIRE(container.positions[0] == Point{5, 5});
    }

    SECTION("per edge") {
        const auto result = layout_root(backend, graph, AnyView(TaggedView("a", log)).padding(EdgeInsets{1, 2, 3, 4}),
                                        SizeProposal{100, 100});
        REQUIRE(result.size.size == Size{26, 14});
        REQUIRE(backend.widget(graph->root_widget()).positions[0] == Point{2, 1});
    }

    SECTION("shrinks the proposal for the child") {
        const auto result = layout_root(backend, graph, AnyView(Text("hello world")).padding(10), SizeProposal{60, 100});
        // 40 px left for the text, so it wraps onto two lines
        REQUIRE(result.child_results.front().size.size == Size{35, 32});
        REQUIRE(result.size.size == Size{55, 52});
    }
}

TEST_CASE("Strict frame", "[ui][modifiers][frame]") {
    HeadlessBackend backend;
    std::unique_ptr<ViewGraph> graph;
    auto log = std::make_shared<std::vector<std::string>>();

    SECTION("both axes") {
        const auto result = layout_root(backend, graph, AnyView(TaggedView("a", log)).frame(100, 50), SizeProposal{10, 10});
        REQUIRE(result.size.size == Size{100, 50});
        REQUIRE(result.size.maximum_width == 100);
        REQUIRE(backend.widget(graph->root_widget()).positions[0] == Point{40, 20});
    }

    SECTION("one axis keeps the child's length on the other") {
        const auto result = layout_root(backend, graph, AnyView(TaggedView("a", log)).frame(100, std::nullopt),
                                        SizeProposal{300, 300});
        REQUIRE(result.size.size == Size{100, 10});
    }

    SECTION("alignment") {
        layout_root(backend, graph, AnyView(TaggedView("a", log)).frame(100, 50, Alignment::top_leading()),
                    SizeProposal{100, 50});
        REQUIRE(backend.widget(graph->root_widget()).positions[0] == Point{0, 0});
    }
}

TEST_CASE("Flexible frame", "[ui][modifiers][frame]") {
    HeadlessBackend backend;
    std::unique_ptr<ViewGraph> graph;
    auto log = std::make_shared<std::vector<std::string>>();

    SECTION("unbounded maximum takes the proposal") {
        const auto result = layout_root(backend, graph,
            AnyView(TaggedView("a", log)).frame(FlexibleFrameOptions{.max_width = k_unbounded}),
            SizeProposal{300, 200});
        REQUIRE(result.size.size == Size{300, 10});
        REQUIRE_FALSE(result.size.maximum_width.has_value());
        REQUIRE(result.size.maximum_height == 10);
        REQUIRE(backend.widget(graph->root_widget()).positions[0] == Point{140, 0});
    }

    SECTION("minimum grows a smaller child") {
        const auto result = layout_root(backend, graph,
            AnyView(TaggedView("a", log)).frame(FlexibleFrameOptions{.min_width = 50}),
            SizeProposal::ideal());
        REQUIRE(result.size.size == Size{50, 10});
        REQUIRE(result.size.minimum_width == 50);
    }

    SECTION("maximum caps the proposal") {
        const auto result = layout_root(backend, graph,
            AnyView(FlexView({10, 0, std::nullopt}, {10, 0, std::nullopt}))
                .frame(FlexibleFrameOptions{.max_width = 80, .max_height = 40}),
            SizeProposal{300, 300});
        REQUIRE(result.size.size == Size{80, 40});
        REQUIRE(result.child_results.front().size.size == Size{80, 40});
        REQUIRE(result.size.maximum_width == 80);
    }

    SECTION("ideal lengths stand in for a missing proposal") {
        const auto result = layout_root(backend, graph,
            AnyView(FlexView({10, 0, std::nullopt}, {10, 0, std::nullopt}))
                .frame(FlexibleFrameOptions{.ideal_width = 64, .ideal_height = 32}),
            SizeProposal::ideal());
        REQUIRE(result.size.size == Size{64, 32});
        REQUIRE(result.size.ideal_size == Size{64, 32});
    }
}

TEST_CASE("Fixed size", "[ui][modifiers]") {
    HeadlessBackend backend;
    std::unique_ptr<ViewGraph> graph;

    SECTION("both axes ignore the proposal") {
        const auto result = layout_root(backend, graph, AnyView(Text("hello world")).fixed_size(), SizeProposal{40, 100});
        REQUIRE(result.size.size == Size{77, 16});
        REQUIRE(result.size.minimum_width == 77);
        REQUIRE(result.size.maximum_width == 77);
    }

    SECTION("vertical only still wraps") {
        const auto result = layout_root(backend, graph, AnyView(Text("hello world")).fixed_size(false, true),
                                        SizeProposal{40, 100});
        REQUIRE(result.size.size == Size{35, 32});
        REQUIRE(result.size.maximum_height == 32);
    }
}

TEST_CASE("On disappear", "[ui][modifiers][lifecycle]") {
    HeadlessBackend backend;
    int disappeared = 0;

    auto graph = std::make_unique<ViewGraph>(
        AnyView(Text("bye")).on_disappear([&disappeared] { ++disappeared; }), backend);
    graph->update(SizeProposal{100, 100});
    graph->update(SizeProposal{50, 100});
    REQUIRE(disappeared == 0);

    SECTION("the latest action runs once, on teardown") {
        int replaced = 0;
        graph->update(AnyView(Text("bye")).on_disappear([&replaced] { ++replaced; }), SizeProposal{100, 100});
        graph.reset();
        REQUIRE(disappeared == 0);
        REQUIRE(replaced == 1);
    }

    SECTION("dropped together with the graph") {
        graph.reset();
        REQUIRE(disappeared == 1);
    }
}

TEST_CASE("Environment modifier scopes", "[ui][modifiers][environment]") {
    HeadlessBackend backend;
    auto inside = std::make_shared<EnvironmentCapture>();
    auto outside = std::make_shared<EnvironmentCapture>();

    ViewGraph graph(
        VStack({
            AnyView(CaptureView(inside)).environment([](const Environment& env) {
                return env.with(&EnvironmentValues::layout_spacing, 2)
                          .cleared(&EnvironmentValues::layout_orientation);
            }),
            CaptureView(outside),
        }),
        backend);
    graph.update(SizeProposal{100, 100});

    REQUIRE(inside->last->layout_spacing() == 2);
    REQUIRE(outside->last->layout_spacing() == 10);
    // Cleared inside the modifier's scope keeps the stack's orientation
    REQUIRE(inside->last->layout_orientation() == Orientation::Vertical);
    REQUIRE(inside->commits == 1);
}
