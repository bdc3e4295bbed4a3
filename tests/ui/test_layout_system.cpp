/// @file test_layout_system.cpp
/// @brief Tests for flex distribution and stack layout

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

#include <loom/ui/layout_system.hpp>

using namespace loom_ui;

// =============================================================================
// Distribution
// =============================================================================

TEST_CASE("Distribute extra space", "[ui][layout]") {
    SECTION("bounded items fill least slack first, the rest goes to unbounded ones") {
        const std::vector<FlexItem> items{
            {50, 0, 100},
            {100, 0, std::nullopt},
            {150, 0, 150},
        };
        REQUIRE(LayoutSystem::distribute(items, 400) == std::vector<int>{100, 150, 150});
    }

    SECTION("remainder pixels go to the earliest unbounded items") {
        const std::vector<FlexItem> items{
            {10, 0, std::nullopt},
            {10, 0, std::nullopt},
            {10, 0, std::nullopt},
        };
        REQUIRE(LayoutSystem::distribute(items, 35) == std::vector<int>{12, 12, 11});
    }

    SECTION("only bounded items stop at their maxima") {
        const std::vector<FlexItem> items{{10, 0, 20}, {10, 0, 15}};
        REQUIRE(LayoutSystem::distribute(items, 100) == std::vector<int>{20, 15});
    }

    SECTION("exact fit keeps ideals") {
        const std::vector<FlexItem> items{{30, 0, std::nullopt}, {70, 0, 90}};
        REQUIRE(LayoutSystem::distribute(items, 100) == std::vector<int>{30, 70});
    }
}

TEST_CASE("Distribute a deficit", "[ui][layout]") {
    SECTION("least shrinkable items give up space first") {
        const std::vector<FlexItem> items{
            {50, 40, std::nullopt},
            {100, 0, std::nullopt},
            {150, 150, 150},
        };
        REQUIRE(LayoutSystem::distribute(items, 200) == std::vector<int>{40, 10, 150});
    }

    SECTION("even shares") {
        const std::vector<FlexItem> items{{50, 0, std::nullopt}, {50, 0, std::nullopt}};
        REQUIRE(LayoutSystem::distribute(items, 60) == std::vector<int>{30, 30});
    }

    SECTION("never below the minimum") {
        const std::vector<FlexItem> items{{50, 50, 50}, {50, 45, std::nullopt}};
        const auto allocation = LayoutSystem::distribute(items, 60);
        REQUIRE(allocation == std::vector<int>{50, 45});
        REQUIRE(allocation[0] + allocation[1] > 60);
    }

    SECTION("negative space is treated as none") {
        const std::vector<FlexItem> items{{10, 0, std::nullopt}};
        REQUIRE(LayoutSystem::distribute(items, -5) == std::vector<int>{0});
    }
}

// =============================================================================
// Stacks
// =============================================================================

TEST_CASE("Vertical stack positions and spacing", "[ui][layout][stack]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    ViewGraph graph(
        VStack({
            TaggedView("a", log, Size{20, 10}),
            TaggedView("b", log, Size{30, 10}),
        }),
        backend);
    const auto result = graph.update(SizeProposal{100, 100});

    REQUIRE(result.size.size == Size{30, 30});

    const auto& stack = backend.widget(graph.root_widget());
    REQUIRE(stack.size == Size{30, 30});
    REQUIRE(stack.children.size() == 2);
    // Centered across the stack
    REQUIRE(stack.positions[0] == Point{5, 0});
    REQUIRE(stack.positions[1] == Point{0, 20});
}

TEST_CASE("Stack alignment and explicit spacing", "[ui][layout][stack]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    ViewGraph graph(
        HStack({
            TaggedView("a", log, Size{20, 10}),
            TaggedView("b", log, Size{20, 30}),
        }, StackAlignment::Trailing, 4),
        backend);
    const auto result = graph.update(SizeProposal{200, 200});

    REQUIRE(result.size.size == Size{44, 30});
    const auto& stack = backend.widget(graph.root_widget());
    REQUIRE(stack.positions[0] == Point{0, 20});
    REQUIRE(stack.positions[1] == Point{24, 0});
}

TEST_CASE("Empty views take no spacing", "[ui][layout][stack]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    ViewGraph graph(
        VStack({
            TaggedView("a", log, Size{20, 10}),
            EmptyView(),
            TaggedView("b", log, Size{20, 10}),
        }),
        backend);
    const auto result = graph.update(SizeProposal{100, 100});

    REQUIRE(result.size.size == Size{20, 30});
    REQUIRE(backend.widget(graph.root_widget()).positions[2] == Point{0, 20});
}

TEST_CASE("Stacks share space among flexible children", "[ui][layout][stack]") {
    HeadlessBackend backend;

    ViewGraph graph(
        HStack({
            FlexView::along(Orientation::Horizontal, 50, 0, 100),
            FlexView::along(Orientation::Horizontal, 100, 0, std::nullopt),
            FlexView::along(Orientation::Horizontal, 150, 0, 150),
        }, StackAlignment::Center, 0),
        backend);
    const auto result = graph.update(SizeProposal{400, 10});

    REQUIRE(result.size.size == Size{400, 10});
    REQUIRE(result.child_results.size() == 3);
    REQUIRE(result.child_results[0].size.size.width == 100);
    REQUIRE(result.child_results[1].size.size.width == 150);
    REQUIRE(result.child_results[2].size.size.width == 150);

    // Hints come from the measuring pass
    REQUIRE(result.size.ideal_size == Size{300, 10});
    REQUIRE(result.size.ideal_width_for_proposed_height == 300);
    REQUIRE(result.size.minimum_width == 0);
    REQUIRE_FALSE(result.size.maximum_width.has_value());
    REQUIRE(result.size.maximum_height == 10);

    const auto& stack = backend.widget(graph.root_widget());
    REQUIRE(stack.positions[1] == Point{100, 0});
    REQUIRE(stack.positions[2] == Point{250, 0});
}

TEST_CASE("Stack without a major proposal uses ideal lengths", "[ui][layout][stack]") {
    HeadlessBackend backend;

    ViewGraph graph(
        VStack({
            FlexView::along(Orientation::Vertical, 40, 0, std::nullopt),
            FlexView::along(Orientation::Vertical, 60, 0, std::nullopt),
        }),
        backend);
    const auto result = graph.update(SizeProposal{50, std::nullopt});

    REQUIRE(result.size.size == Size{10, 110});
}

// =============================================================================
// Overlay
// =============================================================================

TEST_CASE("ZStack sizes to its largest child", "[ui][layout][zstack]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    SECTION("centered") {
        ViewGraph graph(
            ZStack({
                TaggedView("a", log, Size{20, 10}),
                TaggedView("b", log, Size{40, 30}),
            }),
            backend);
        const auto result = graph.update(SizeProposal{100, 100});

        REQUIRE(result.size.size == Size{40, 30});
        REQUIRE(result.size.maximum_width == 40);
        REQUIRE(result.size.minimum_height == 30);

        const auto& stack = backend.widget(graph.root_widget());
        REQUIRE(stack.positions[0] == Point{10, 10});
        REQUIRE(stack.positions[1] == Point{0, 0});
    }

    SECTION("aligned to a corner") {
        ViewGraph graph(
            ZStack({
                TaggedView("a", log, Size{20, 10}),
                TaggedView("b", log, Size{40, 30}),
            }, Alignment::bottom_trailing()),
            backend);
        graph.update(SizeProposal{100, 100});
        REQUIRE(backend.widget(graph.root_widget()).positions[0] == Point{20, 20});
    }

    SECTION("an unbounded child lifts the maximum") {
        ViewGraph graph(
            ZStack({
                TaggedView("a", log, Size{20, 10}),
                FlexView(AxisSpec{10, 0, std::nullopt}, AxisSpec{10, 0, std::nullopt}),
            }),
            backend);
        const auto result = graph.update(SizeProposal{100, 80});
        REQUIRE(result.size.size == Size{100, 80});
        REQUIRE_FALSE(result.size.maximum_width.has_value());
    }
}
