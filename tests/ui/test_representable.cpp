/// @file test_representable.cpp
/// @brief Tests for backend-native representable views

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

using namespace loom_ui;
using loom_core::ContractViolation;

namespace {

struct LabelCoordinator {
    EventLog log;
    int updates = 0;
};

/// Native text label driven directly through the headless backend
class NativeLabel : public WidgetRepresentable<HeadlessBackend, LabelCoordinator> {
public:
    NativeLabel(std::string text, EventLog log) : m_text(std::move(text)), m_log(std::move(log)) {}

    [[nodiscard]] std::string name() const override { return "NativeLabel"; }

    [[nodiscard]] LabelCoordinator make_coordinator() const override {
        m_log->push_back("coordinator");
        return LabelCoordinator{m_log, 0};
    }

    [[nodiscard]] WidgetHandle make_widget(HeadlessBackend& backend, Context& context) const override {
        context.coordinator.log->push_back("make");
        return backend.create_text_view();
    }

    void update_widget(HeadlessBackend& backend, WidgetHandle widget, Context& context) const override {
        ++context.coordinator.updates;
        backend.update_text_view(widget, m_text, context.environment);
    }

    void dismantle_widget(HeadlessBackend& backend, WidgetHandle widget,
                          LabelCoordinator& coordinator) const override {
        coordinator.log->push_back(backend.find(widget) ? "dismantle:live" : "dismantle:gone");
        coordinator.log->push_back("updates:" + std::to_string(coordinator.updates));
    }

private:
    std::string m_text;
    EventLog m_log;
};

class SpecialBackend : public HeadlessBackend {
public:
    [[nodiscard]] std::string name() const override { return "special"; }
};

/// Only renders on SpecialBackend
class SpecialWidget : public WidgetRepresentable<SpecialBackend> {
public:
    [[nodiscard]] std::string name() const override { return "SpecialWidget"; }

    [[nodiscard]] WidgetHandle make_widget(SpecialBackend& backend, Context& /*context*/) const override {
        return backend.create_container();
    }
};

} // namespace

TEST_CASE("Representable lifecycle", "[ui][representable]") {
    HeadlessBackend backend;
    auto log = std::make_shared<std::vector<std::string>>();
    {
        ViewGraph graph(NativeLabel("hello", log), backend);
        REQUIRE(*log == std::vector<std::string>{"coordinator", "make"});

        SECTION("default sizing follows the native widget") {
            REQUIRE(graph.update(SizeProposal::ideal()).size.size == Size{35, 16});
            const auto result = graph.update(SizeProposal{100, 100});
            REQUIRE(result.size.size == Size{100, 16});
            REQUIRE(result.size.ideal_size == Size{35, 16});
            REQUIRE(backend.widget(graph.root_widget()).text == "hello");
        }

        SECTION("updates reuse the widget and coordinator") {
            graph.update(SizeProposal{100, 100});
            graph.update(NativeLabel("bye", log), SizeProposal{100, 100});
            REQUIRE(backend.widget(graph.root_widget()).text == "bye");
            REQUIRE(log->size() == 2);
        }
    }

    // Dismantled before the widget is destroyed
    REQUIRE(log->at(2) == "dismantle:live");
    REQUIRE(backend.live_widget_count() == 0);
}

TEST_CASE("Representables only render on their backend", "[ui][representable]") {
    SECTION("another backend") {
        HeadlessBackend backend;
        REQUIRE_THROWS_AS(ViewGraph(SpecialWidget(), backend), ContractViolation);
    }

    SECTION("the matching backend") {
        SpecialBackend backend;
        ViewGraph graph(SpecialWidget(), backend);
        REQUIRE(backend.widget(graph.root_widget()).kind == HeadlessWidgetKind::Container);
    }
}
