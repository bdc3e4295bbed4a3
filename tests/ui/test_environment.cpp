/// @file test_environment.cpp
/// @brief Tests for environment propagation

#include <catch2/catch_test_macros.hpp>

#include "test_views.hpp"

using namespace loom_ui;

TEST_CASE("Environment overrides", "[ui][environment]") {
    const auto base = Environment{}.scoped();

    SECTION("with then read") {
        const auto big = base.with(&EnvironmentValues::font, Font::system(20));
        REQUIRE(big.font().size == 20);
        REQUIRE(base.font().size == 12);
    }

    SECTION("with then cleared restores the scope value") {
        const auto spaced = base.with(&EnvironmentValues::layout_spacing, 4);
        REQUIRE(spaced.layout_spacing() == 4);
        REQUIRE(spaced.cleared(&EnvironmentValues::layout_spacing).layout_spacing() == 10);
    }

    SECTION("cleared follows the latest scope") {
        const auto dark = base.with(&EnvironmentValues::color_scheme, ColorScheme::Dark).scoped();
        const auto light = dark.with(&EnvironmentValues::color_scheme, ColorScheme::Light);
        REQUIRE(light.cleared(&EnvironmentValues::color_scheme).color_scheme() == ColorScheme::Dark);
    }

    SECTION("copies share storage until written") {
        const auto copy = base;
        REQUIRE(copy.shares_storage_with(base));
        REQUIRE_FALSE(base.with(&EnvironmentValues::layout_spacing, 1).shares_storage_with(base));
    }

    SECTION("an override keeps every other key") {
        const auto named = base
            .with(&EnvironmentValues::font, Font::system(18))
            .with(&EnvironmentValues::layout_spacing, 3);
        const auto dark = named.with(&EnvironmentValues::color_scheme, ColorScheme::Dark);
        REQUIRE(dark.font() == named.font());
        REQUIRE(dark.layout_spacing() == 3);
        REQUIRE(dark.foreground_color() == named.foreground_color());
        REQUIRE(named.color_scheme() == ColorScheme::Light);
    }

    SECTION("state change handler") {
        int calls = 0;
        const auto env = base.with(&EnvironmentValues::on_state_change, std::function<void()>([&calls] { ++calls; }));
        env.notify_state_change();
        base.notify_state_change();
        REQUIRE(calls == 1);
    }
}

TEST_CASE("Environment modifiers reach descendants", "[ui][environment]") {
    HeadlessBackend backend;
    auto capture = std::make_shared<EnvironmentCapture>();

    ViewGraph graph(
        AnyView(VStack({
            CaptureView(capture),
        })).foreground_color(Color::red()).font(Font::system(18)),
        backend);
    graph.update(SizeProposal{200, 100});

    REQUIRE(capture->last.has_value());
    REQUIRE(capture->last->foreground_color() == Color::red());
    REQUIRE(capture->last->font().size == 18);
    // Stacks hand their orientation down to children
    REQUIRE(capture->last->layout_orientation() == Orientation::Vertical);
    REQUIRE(capture->last->backend() == &backend);
}

TEST_CASE("Root environment follows the backend theme", "[ui][environment]") {
    HeadlessBackend backend;
    auto capture = std::make_shared<EnvironmentCapture>();
    ViewGraph graph(CaptureView(capture), backend);
    graph.update(SizeProposal{100, 100});

    REQUIRE(capture->last->color_scheme() == ColorScheme::Light);
    REQUIRE(capture->last->foreground_color() == Color::black());

    backend.set_color_scheme(ColorScheme::Dark);

    REQUIRE(graph.update_count() == 2);
    REQUIRE(capture->last->color_scheme() == ColorScheme::Dark);
    REQUIRE(capture->last->foreground_color() == Color::white());
}

TEST_CASE("Every graph on a backend follows theme switches", "[ui][environment]") {
    HeadlessBackend backend;
    auto first = std::make_unique<ViewGraph>(Text("first"), backend);
    ViewGraph second(Text("second"), backend);
    first->update(SizeProposal{100, 100});
    second.update(SizeProposal{100, 100});
    REQUIRE(backend.root_environment_subscriber_count() == 2);

    SECTION("both graphs refresh") {
        backend.set_color_scheme(ColorScheme::Dark);
        REQUIRE(first->update_count() == 2);
        REQUIRE(second.update_count() == 2);
        REQUIRE(first->root_environment().color_scheme() == ColorScheme::Dark);
        REQUIRE(second.root_environment().color_scheme() == ColorScheme::Dark);
    }

    SECTION("destroying one graph keeps the other subscribed") {
        first.reset();
        REQUIRE(backend.root_environment_subscriber_count() == 1);

        backend.set_color_scheme(ColorScheme::Dark);
        REQUIRE(second.update_count() == 2);
        REQUIRE(second.root_environment().color_scheme() == ColorScheme::Dark);
        REQUIRE(backend.widget(second.root_widget()).text == "second");
    }
}

TEST_CASE("Root environment subscriptions are removed by id", "[ui][environment]") {
    HeadlessBackend backend;
    int calls = 0;
    const auto id = backend.subscribe_root_environment_change([&calls]() { ++calls; });
    REQUIRE(id.is_valid());

    backend.set_scale_factor(2.0);
    REQUIRE(calls == 1);

    REQUIRE(backend.unsubscribe_root_environment_change(id));
    REQUIRE_FALSE(backend.unsubscribe_root_environment_change(id));

    backend.set_scale_factor(1.0);
    REQUIRE(calls == 1);
}
