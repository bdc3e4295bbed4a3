/// @file test_list.cpp
/// @brief Tests for List and ForEach

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

#include <string>

using namespace loom_ui;

namespace {

RowBuilder numbered_rows(const std::string& prefix) {
    return [prefix](std::size_t i) { return AnyView(Text(prefix + std::to_string(i))); };
}

} // namespace

TEST_CASE("List rows", "[ui][list]") {
    HeadlessBackend backend;
    ViewGraph graph(List(5, numbered_rows("Row ")), backend);
    const auto result = graph.update(SizeProposal{200, std::nullopt});

    const auto& list = backend.widget(graph.root_widget());
    REQUIRE(list.kind == HeadlessWidgetKind::SelectableList);
    REQUIRE(list.children.size() == 5);

    SECTION("rows are padded to the minimum row height") {
        // 16 px text + 8 px row padding + 4 px toolkit padding
        REQUIRE(list.row_heights == std::vector<int>(5, 28));
        REQUIRE(result.size.size == Size{200, 140});
        REQUIRE(list.positions[3] == Point{0, 84});
    }

    SECTION("ideal width comes from the widest row") {
        // "Row 0" is 35 px, plus 8 px padding, plus 8 px toolkit padding
        REQUIRE(result.size.ideal_size == Size{51, 140});
        // The longest word, "Row", is 21 px
        REQUIRE(result.size.minimum_width == 37);
        REQUIRE(result.size.maximum_height == 140);
    }
}

TEST_CASE("List keeps rows by position", "[ui][list]") {
    HeadlessBackend backend;
    ViewGraph graph(List(5, numbered_rows("Row ")), backend);
    graph.update(SizeProposal{200, std::nullopt});

    const auto before = backend.widget(graph.root_widget()).children;
    const auto live = backend.live_widget_count();

    graph.update(List(3, numbered_rows("Item ")), SizeProposal{200, std::nullopt});

    const auto& list = backend.widget(graph.root_widget());
    REQUIRE(list.children.size() == 3);
    for (std::size_t i = 0; i < 3; ++i) {
        REQUIRE(list.children[i] == before[i]);
    }
    REQUIRE(backend.find(before[3]) == nullptr);
    REQUIRE(backend.find(before[4]) == nullptr);
    // Each row is a padding container around a text view
    REQUIRE(backend.live_widget_count() == live - 4);

    const auto texts = find_all(backend, graph.root_widget(), HeadlessWidgetKind::Text);
    REQUIRE(texts.size() == 3);
    REQUIRE(texts[0]->text == "Item 0");

    SECTION("growing adds rows at the end") {
        graph.update(List(4, numbered_rows("Item ")), SizeProposal{200, std::nullopt});
        const auto& grown = backend.widget(graph.root_widget());
        REQUIRE(grown.children.size() == 4);
        REQUIRE(grown.children[0] == before[0]);
        REQUIRE(grown.row_heights.size() == 4);
    }
}

TEST_CASE("Dropped rows run their disappear actions", "[ui][list][lifecycle]") {
    HeadlessBackend backend;
    auto gone = std::make_shared<std::vector<std::size_t>>();
    auto tracked_rows = [gone](std::size_t i) {
        return AnyView(Text("Row " + std::to_string(i))).on_disappear([gone, i] { gone->push_back(i); });
    };

    SECTION("List") {
        auto graph = std::make_unique<ViewGraph>(List(5, tracked_rows), backend);
        graph->update(SizeProposal{200, std::nullopt});

        graph->update(List(3, tracked_rows), SizeProposal{200, std::nullopt});
        REQUIRE(*gone == std::vector<std::size_t>{4, 3});

        graph.reset();
        REQUIRE(gone->size() == 5);
    }

    SECTION("ForEach") {
        auto make_root = [&tracked_rows](std::size_t count) {
            return VStack({ForEach(count, tracked_rows)});
        };
        auto graph = std::make_unique<ViewGraph>(make_root(5), backend);
        graph->update(SizeProposal{200, 200});

        graph->update(make_root(3), SizeProposal{200, 200});
        REQUIRE(*gone == std::vector<std::size_t>{4, 3});

        graph.reset();
        REQUIRE(gone->size() == 5);
    }

    REQUIRE(backend.live_widget_count() == 0);
}

TEST_CASE("List selection", "[ui][list]") {
    HeadlessBackend backend;
    auto selection = std::make_shared<std::optional<std::size_t>>(1);

    ViewGraph graph(
        List(3, numbered_rows("Row "), Binding<std::optional<std::size_t>>::shared(selection)),
        backend);
    graph.update(SizeProposal{200, std::nullopt});
    const auto list = graph.root_widget();

    REQUIRE(backend.widget(list).selected == std::optional<std::size_t>(1));

    SECTION("user selection writes the binding") {
        REQUIRE(backend.select_row(list, 2));
        REQUIRE(*selection == std::optional<std::size_t>(2));
    }

    SECTION("out of range rows are ignored") {
        backend.select_row(list, 7);
        REQUIRE(*selection == std::optional<std::size_t>(1));
    }

    SECTION("a stale selection shows as none") {
        *selection = 9;
        graph.update(SizeProposal{200, std::nullopt});
        REQUIRE_FALSE(backend.widget(list).selected.has_value());
    }
}

TEST_CASE("ForEach lays out along the enclosing stack", "[ui][list][foreach]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();

    auto make_root = [log](std::size_t count) {
        return HStack({
            ForEach(count, [log](std::size_t i) {
                return AnyView(TaggedView("cell" + std::to_string(i), log, Size{20, 10}));
            }),
        }, StackAlignment::Center, 5);
    };

    ViewGraph graph(make_root(3), backend);
    const auto result = graph.update(SizeProposal{200, 50});

    // Rows follow the stack's orientation and spacing
    REQUIRE(result.size.size == Size{70, 10});
    const auto for_each = backend.widget(graph.root_widget()).children.front();
    REQUIRE(backend.widget(for_each).positions[2] == Point{50, 0});

    graph.update(make_root(2), SizeProposal{200, 50});
    REQUIRE(backend.widget(for_each).children.size() == 2);
    REQUIRE(log->size() == 3);

    graph.update(make_root(4), SizeProposal{200, 50});
    REQUIRE(backend.widget(for_each).children.size() == 4);
    REQUIRE(log->back() == "create:cell3");
}
