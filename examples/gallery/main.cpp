/// @file main.cpp
/// @brief View gallery rendered with the headless backend
///
/// Builds a small application out of every built-in view kind, runs a few
/// update cycles (including a simulated click and a theme switch) and logs
/// the resulting widget tree. Pass a configuration file as the first
/// argument and a snapshot path as the second to persist the view state.

#include <loom/ui/ui.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace loom_ui::prelude;

namespace {

/// Locate the default configuration relative to common working directories
std::filesystem::path find_default_config() {
    std::vector<std::filesystem::path> candidates = {
        "config/default.json",
        "../config/default.json",
        "../../config/default.json",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

class Gallery : public CompositeView {
public:
    [[nodiscard]] std::string name() const override { return "Gallery"; }

    [[nodiscard]] AnyView body(ViewContext& context) const override {
        auto clicks = context.state<int>("clicks", 0);
        auto show_shapes = context.state<bool>("show_shapes", true);

        auto fruit_index = context.state<int>("fruit", 1);
        Binding<std::optional<std::size_t>> fruit(
            [fruit_index]() -> std::optional<std::size_t> {
                const int index = fruit_index.get();
                if (index < 0) {
                    return std::nullopt;
                }
                return static_cast<std::size_t>(index);
            },
            [fruit_index](const std::optional<std::size_t>& index) {
                fruit_index.set(index ? static_cast<int>(*index) : -1);
            });
        const std::vector<std::string> fruits = {"Apple", "Banana", "Cherry"};

        AnyView header = AnyView(Text("loom gallery")).font(Font::system(20, loom_ui::FontWeight::Bold));

        AnyView counter = HStack({
            Text("Clicks: " + std::to_string(clicks.get())),
            Spacer(),
            Button("Click me", [clicks]() { clicks.set(clicks.get() + 1); }),
            Button(show_shapes.get() ? "Hide shapes" : "Show shapes",
                   [show_shapes]() { show_shapes.set(!show_shapes.get()); }),
        });

        AnyView shapes = EitherView(
            show_shapes.get(),
            HStack({
                AnyView(Rectangle().fill(Color::red())).frame(40, 40),
                AnyView(RoundedRectangle(8).fill(Color::green())).frame(60, 40),
                AnyView(Circle().stroke(Color::blue(), loom_ui::StrokeStyle{2.0})).frame(40, 40),
                AnyView(Capsule()).frame(80, 30),
            }),
            Text("Shapes hidden"));

        AnyView rows = List(
            fruits.size(),
            [fruits](std::size_t index) { return AnyView(Text(fruits[index])); },
            fruit);

        AnyView progress = VStack({
            ProgressBar(std::min(clicks.get(), 10) / 10.0),
            ProgressSpinner(),
            Picker(fruits, fruit),
        }, StackAlignment::Leading);

        return ScrollView({
            header,
            counter,
            shapes,
            AnyView(rows).frame(FlexibleFrameOptions{.min_width = 120, .max_height = 120}),
            AnyView(progress).padding(8),
        });
    }
};

void log_widget_tree(const HeadlessBackend& backend, loom_ui::WidgetHandle handle, int depth) {
    const auto& widget = backend.widget(handle);
    spdlog::info("{:>{}}{} #{} {}x{}{}", "", depth * 2, loom_ui::to_string(widget.kind), handle.id,
                 widget.size.width, widget.size.height,
                 widget.text.empty() ? std::string() : " \"" + widget.text + "\"");
    for (const auto& child : widget.children) {
        log_widget_tree(backend, child, depth + 1);
    }
}

/// First button in the tree, depth first
std::optional<loom_ui::WidgetHandle> find_button(const HeadlessBackend& backend, loom_ui::WidgetHandle handle) {
    const auto& widget = backend.widget(handle);
    if (widget.kind == loom_ui::HeadlessWidgetKind::Button) {
        return handle;
    }
    for (const auto& child : widget.children) {
        if (auto found = find_button(backend, child)) {
            return found;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char** argv) {
    loom_core::init_logging();

    std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1]) : find_default_config();
    EngineConfig config = EngineConfig::defaults();
    if (!config_path.empty()) {
        auto loaded = loom_ui::load_engine_config(config_path.string());
        if (loaded.is_err()) {
            spdlog::error("Failed to load configuration: {}", loom_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(loaded).value();
        spdlog::info("Loaded configuration from {}", config_path.string());
    }
    loom_ui::apply_logging(config);

    const std::string snapshot_path = argc > 2 ? argv[2] : "";
    std::optional<NodeSnapshot> snapshot;
    if (!snapshot_path.empty() && std::filesystem::exists(snapshot_path)) {
        auto loaded = loom_ui::load_snapshot(snapshot_path);
        if (loaded.is_ok()) {
            snapshot = std::move(loaded).value();
        }
    }

    HeadlessBackend backend(loom_ui::HeadlessOptions::from_config(config));
    ViewGraph graph(Gallery(), backend, config, snapshot ? &*snapshot : nullptr);

    const SizeProposal window{480, 360};
    graph.update(window);
    log_widget_tree(backend, graph.root_widget(), 0);

    if (auto button = find_button(backend, graph.root_widget())) {
        backend.click(*button);
        spdlog::info("Clicked button, {} update(s) queued", backend.pending_main_thread_tasks());
        backend.drain_main_thread();
    }

    backend.set_color_scheme(ColorScheme::Dark);
    spdlog::info("After {} updates:", graph.update_count());
    log_widget_tree(backend, graph.root_widget(), 0);

    if (!snapshot_path.empty()) {
        auto saved = loom_ui::save_snapshot(graph.snapshot(), snapshot_path);
        if (saved.is_err()) {
            spdlog::error("Failed to save snapshot: {}", loom_core::build_error_chain(saved.error()));
            return 1;
        }
        spdlog::info("Saved snapshot to {}", snapshot_path);
    }

    loom_core::shutdown_logging();
    return 0;
}
