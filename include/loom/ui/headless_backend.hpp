#pragma once

/// @file headless_backend.hpp
/// @brief In-memory backend with deterministic text metrics
///
/// Keeps a widget tree in memory, measures text on a fixed character grid and
/// lets callers simulate clicks, selections and theme switches. Used by the
/// test suite and for rendering trees without a display.

#include "backend.hpp"
#include "config.hpp"

#include <deque>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace loom_ui {

// =============================================================================
// Headless Widget Model
// =============================================================================

enum class HeadlessWidgetKind : std::uint8_t {
    Container,
    Text,
    Button,
    ImageView,
    ScrollContainer,
    Picker,
    SelectableList,
    ProgressBar,
    ProgressSpinner,
    PathWidget,
};

[[nodiscard]] constexpr const char* to_string(HeadlessWidgetKind kind) {
    switch (kind) {
        case HeadlessWidgetKind::Container: return "Container";
        case HeadlessWidgetKind::Text: return "Text";
        case HeadlessWidgetKind::Button: return "Button";
        case HeadlessWidgetKind::ImageView: return "ImageView";
        case HeadlessWidgetKind::ScrollContainer: return "ScrollContainer";
        case HeadlessWidgetKind::Picker: return "Picker";
        case HeadlessWidgetKind::SelectableList: return "SelectableList";
        case HeadlessWidgetKind::ProgressBar: return "ProgressBar";
        case HeadlessWidgetKind::ProgressSpinner: return "ProgressSpinner";
        case HeadlessWidgetKind::PathWidget: return "PathWidget";
    }
    return "Unknown";
}

/// State of one in-memory widget
struct HeadlessWidget {
    WidgetHandle handle;
    HeadlessWidgetKind kind = HeadlessWidgetKind::Container;
    WidgetHandle parent;
    std::vector<WidgetHandle> children;
    std::vector<Point> positions;
    Size size;

    // Text and buttons
    std::string text;
    Font font;
    std::size_t text_updates = 0;

    // Pickers and lists
    std::vector<std::string> options;
    std::optional<std::size_t> selected;
    std::vector<int> row_heights;

    // Scroll containers
    bool has_vertical_scroll_bar = false;
    bool has_horizontal_scroll_bar = false;

    // Progress bars
    std::optional<double> progress;

    // Image views
    std::optional<Size> image_size;
    double image_scale_factor = 1.0;
    std::size_t image_updates = 0;

    // Path widgets
    PathHandle rendered_path;
    std::optional<Color> fill;
    std::optional<Color> stroke;
    std::size_t path_renders = 0;
};

/// Fixed metrics of the headless "toolkit"
struct HeadlessMetrics {
    /// Advance of every character at a 12 pt font
    int char_width = 7;
    /// Line height at a 12 pt font
    int line_height = 16;
    int scroll_bar_width = 12;
    EdgeInsets base_item_padding{2, 4, 2, 4};
    Size minimum_row_size{0, 24};
    bool image_update_on_scale_factor_change = true;
};

struct HeadlessOptions {
    HeadlessMetrics metrics;
    BackendCalibration calibration;
    ColorScheme color_scheme = ColorScheme::Light;
    Color light_foreground = Color::black();
    Color dark_foreground = Color::white();
    double scale_factor = 1.0;

    /// Options matching an engine configuration
    [[nodiscard]] static HeadlessOptions from_config(const EngineConfig& config);
};

// =============================================================================
// HeadlessBackend
// =============================================================================

class HeadlessBackend : public IBackend {
public:
    explicit HeadlessBackend(HeadlessOptions options = {});
    ~HeadlessBackend() override = default;

    HeadlessBackend(const HeadlessBackend&) = delete;
    HeadlessBackend& operator=(const HeadlessBackend&) = delete;

    [[nodiscard]] BackendType type() const override { return BackendType::Headless; }
    [[nodiscard]] std::string name() const override { return "headless"; }

    [[nodiscard]] Environment compute_root_environment(const Environment& defaults) override;
    [[nodiscard]] SubscriptionId subscribe_root_environment_change(std::function<void()> handler) override;
    bool unsubscribe_root_environment_change(SubscriptionId id) override;
    void run_in_main_thread(std::function<void()> action) override;

    void destroy_widget(WidgetHandle widget) override;

    [[nodiscard]] WidgetHandle create_container() override;
    void add_child(WidgetHandle child, WidgetHandle container) override;
    void remove_child(WidgetHandle child, WidgetHandle container) override;
    void remove_all_children(WidgetHandle container) override;
    void set_position(WidgetHandle container, std::size_t child_index, Point position) override;

    [[nodiscard]] Size natural_size(WidgetHandle widget) override;
    void set_size(WidgetHandle widget, Size size) override;
    [[nodiscard]] Measurement measure(WidgetHandle widget, Orientation orientation,
                                      int perpendicular_length) override;

    [[nodiscard]] WidgetHandle create_text_view() override;
    void update_text_view(WidgetHandle widget, const std::string& content,
                          const Environment& environment) override;
    [[nodiscard]] Size text_size(const std::string& text, WidgetHandle widget,
                                 std::optional<Size> proposed_frame,
                                 const Environment& environment) override;

    [[nodiscard]] WidgetHandle create_button() override;
    void update_button(WidgetHandle widget, const std::string& label,
                       const Environment& environment) override;
    void set_button_action(WidgetHandle widget, std::function<void()> action) override;

    [[nodiscard]] WidgetHandle create_image_view() override;
    void update_image_view(WidgetHandle widget, const RgbaImage& image, Size size,
                           double scale_factor) override;
    [[nodiscard]] bool requires_image_update_on_scale_factor_change() const override {
        return m_options.metrics.image_update_on_scale_factor_change;
    }

    [[nodiscard]] WidgetHandle create_scroll_container(WidgetHandle content) override;
    void set_scroll_bar_presence(WidgetHandle widget, bool has_vertical_scroll_bar,
                                 bool has_horizontal_scroll_bar) override;
    [[nodiscard]] int scroll_bar_width() const override { return m_options.metrics.scroll_bar_width; }

    [[nodiscard]] WidgetHandle create_picker() override;
    void update_picker(WidgetHandle widget, const std::vector<std::string>& options,
                       const Environment& environment) override;
    void set_picker_change_handler(WidgetHandle widget,
                                   std::function<void(std::optional<std::size_t>)> handler) override;
    void set_selected_option(WidgetHandle widget, std::optional<std::size_t> index) override;

    [[nodiscard]] WidgetHandle create_selectable_list() override;
    [[nodiscard]] EdgeInsets base_item_padding(WidgetHandle widget) override;
    [[nodiscard]] Size minimum_row_size(WidgetHandle widget) override;
    void set_items(WidgetHandle widget, const std::vector<WidgetHandle>& rows,
                   const std::vector<int>& row_heights) override;
    void set_selection_handler(WidgetHandle widget, std::function<void(std::size_t)> handler) override;
    void set_selected_item(WidgetHandle widget, std::optional<std::size_t> index) override;

    [[nodiscard]] WidgetHandle create_progress_bar() override;
    void update_progress_bar(WidgetHandle widget, std::optional<double> fraction) override;
    [[nodiscard]] WidgetHandle create_progress_spinner() override;

    [[nodiscard]] WidgetHandle create_path_widget() override;
    [[nodiscard]] PathHandle create_path() override;
    void update_path(PathHandle path, const Path& geometry, Rect bounds, bool points_changed) override;
    void render_path(PathHandle path, WidgetHandle widget, std::optional<Color> fill,
                     std::optional<Color> stroke, const StrokeStyle& stroke_style) override;
    void destroy_path(PathHandle path) override;

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Widget state, or nullptr once destroyed
    [[nodiscard]] const HeadlessWidget* find(WidgetHandle widget) const;

    /// Widget state; a missing widget is a contract violation
    [[nodiscard]] const HeadlessWidget& widget(WidgetHandle widget) const;

    [[nodiscard]] std::size_t created_count(HeadlessWidgetKind kind) const;
    [[nodiscard]] std::size_t created_count() const;
    [[nodiscard]] std::size_t destroyed_count() const noexcept { return m_destroyed; }
    [[nodiscard]] std::size_t live_widget_count() const noexcept { return m_widgets.size(); }
    [[nodiscard]] std::size_t live_path_count() const noexcept { return m_paths.size(); }
    [[nodiscard]] std::size_t path_update_count() const noexcept { return m_path_updates; }
    [[nodiscard]] std::size_t path_point_updates() const noexcept { return m_path_point_updates; }
    [[nodiscard]] std::size_t pending_main_thread_tasks() const noexcept { return m_main_thread_queue.size(); }
    [[nodiscard]] std::size_t root_environment_subscriber_count() const noexcept {
        return m_root_environment_handlers.size();
    }

    /// Position of `child` inside its parent
    [[nodiscard]] Point position_of(WidgetHandle child) const;

    [[nodiscard]] const HeadlessMetrics& metrics() const noexcept { return m_options.metrics; }

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Invoke a button's action; false when none is bound
    bool click(WidgetHandle button);

    /// Pick an option the way a user would
    bool choose_option(WidgetHandle picker, std::optional<std::size_t> index);

    /// Select a row of a selectable list
    bool select_row(WidgetHandle list, std::size_t index);

    /// Switch the platform theme and notify the root environment handlers
    void set_color_scheme(ColorScheme scheme);

    /// Move the window to a display with another scale factor
    void set_scale_factor(double scale_factor);

    /// Run queued main-thread tasks, including ones queued while draining
    std::size_t drain_main_thread();

private:
    HeadlessWidget& lookup(WidgetHandle widget, const char* operation);
    void notify_root_environment_change();
    WidgetHandle create(HeadlessWidgetKind kind);
    void detach(HeadlessWidget& child);

    [[nodiscard]] int char_width(const Font& font) const;
    [[nodiscard]] int line_height(const Font& font) const;
    [[nodiscard]] Size layout_text(const std::string& text, const Font& font, std::optional<int> max_width) const;
    [[nodiscard]] int longest_word_width(const std::string& text, const Font& font) const;

    HeadlessOptions m_options;
    std::unordered_map<std::uint64_t, HeadlessWidget> m_widgets;
    std::uint64_t m_next_widget_id = 1;
    std::unordered_set<std::uint64_t> m_paths;
    std::uint64_t m_next_path_id = 1;
    std::size_t m_path_updates = 0;
    std::size_t m_path_point_updates = 0;

    std::unordered_map<std::uint64_t, std::function<void()>> m_button_actions;
    std::unordered_map<std::uint64_t, std::function<void(std::optional<std::size_t>)>> m_picker_handlers;
    std::unordered_map<std::uint64_t, std::function<void(std::size_t)>> m_selection_handlers;

    std::map<HeadlessWidgetKind, std::size_t> m_created;
    std::size_t m_destroyed = 0;

    std::deque<std::function<void()>> m_main_thread_queue;
    std::vector<std::pair<SubscriptionId, std::function<void()>>> m_root_environment_handlers;
    std::uint64_t m_next_subscription_id = 1;
};

} // namespace loom_ui
