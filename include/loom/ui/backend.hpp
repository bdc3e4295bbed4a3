#pragma once

/// @file backend.hpp
/// @brief Capability contract every native widget backend implements
///
/// The view graph never touches native widgets directly. It creates and
/// mutates them through `IBackend`:
///
/// ```
///  ViewGraph ──► GraphNode ──► View::as_widget / compute_layout / commit
///                                         │
///                                         ▼
///                               ┌───────────────────┐
///                               │  IBackend         │
///                               │  create_* / set_* │
///                               └───────────────────┘
///                                 │        │       │
///                                 ▼        ▼       ▼
///                              Headless   GTK    WinUI ...
/// ```
///
/// Widgets are referred to by `WidgetHandle`. Event handlers registered
/// through `set_*_handler`/`set_button_action` belong to the backend
/// instance and are dropped by `destroy_widget`.

#include "fwd.hpp"
#include "environment.hpp"
#include "path.hpp"
#include "types.hpp"
#include "view_size.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loom_ui {

// =============================================================================
// Backend Type
// =============================================================================

enum class BackendType : std::uint8_t {
    Headless,  ///< In-memory widget tree (tests, snapshots)
    Gtk,
    Gtk3,
    WinUI,
    AppKit,
    UIKit,
};

[[nodiscard]] constexpr const char* to_string(BackendType type) {
    switch (type) {
        case BackendType::Headless: return "Headless";
        case BackendType::Gtk: return "GTK";
        case BackendType::Gtk3: return "GTK3";
        case BackendType::WinUI: return "WinUI";
        case BackendType::AppKit: return "AppKit";
        case BackendType::UIKit: return "UIKit";
    }
    return "Unknown";
}

// =============================================================================
// Handles
// =============================================================================

/// Native widget reference owned by a graph node
struct WidgetHandle {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }
    constexpr bool operator==(const WidgetHandle&) const = default;
};

/// Registration of a root environment change handler
struct SubscriptionId {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }
    constexpr bool operator==(const SubscriptionId&) const = default;
};

/// Backend-side path geometry owned by a shape view
struct PathHandle {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }
    constexpr bool operator==(const PathHandle&) const = default;
};

/// Decoded image, 8-bit RGBA rows
struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] Size size() const { return {width, height}; }
    bool operator==(const RgbaImage&) const = default;
};

/// Result of measuring a widget along one axis
struct Measurement {
    int minimum = 0;
    int natural = 0;
};

// =============================================================================
// IBackend
// =============================================================================

class IBackend {
public:
    virtual ~IBackend() = default;

    [[nodiscard]] virtual BackendType type() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;

    // -------------------------------------------------------------------------
    // Environment & scheduling
    // -------------------------------------------------------------------------

    /// Apply platform theme and defaults on top of the configured environment
    [[nodiscard]] virtual Environment compute_root_environment(const Environment& defaults) = 0;

    /// Register `handler` to run when the platform theme changes. Every
    /// registration is kept until removed with its id.
    [[nodiscard]] virtual SubscriptionId subscribe_root_environment_change(std::function<void()> handler) = 0;

    /// Remove one registration. Returns false if `id` is unknown.
    virtual bool unsubscribe_root_environment_change(SubscriptionId id) = 0;

    /// Marshal an action onto the UI thread
    virtual void run_in_main_thread(std::function<void()> action) = 0;

    // -------------------------------------------------------------------------
    // Widget lifetime
    // -------------------------------------------------------------------------

    /// Detach a widget from its parent and release it with its handlers
    virtual void destroy_widget(WidgetHandle widget) = 0;

    // -------------------------------------------------------------------------
    // Containers & geometry
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_container() = 0;
    virtual void add_child(WidgetHandle child, WidgetHandle container) = 0;
    virtual void remove_child(WidgetHandle child, WidgetHandle container) = 0;
    virtual void remove_all_children(WidgetHandle container) = 0;
    virtual void set_position(WidgetHandle container, std::size_t child_index, Point position) = 0;

    [[nodiscard]] virtual Size natural_size(WidgetHandle widget) = 0;
    virtual void set_size(WidgetHandle widget, Size size) = 0;

    /// Measure along `orientation` given a fixed perpendicular length
    [[nodiscard]] virtual Measurement measure(WidgetHandle widget, Orientation orientation,
                                              int perpendicular_length) = 0;

    // -------------------------------------------------------------------------
    // Text
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_text_view() = 0;
    virtual void update_text_view(WidgetHandle widget, const std::string& content,
                                  const Environment& environment) = 0;

    /// Size of `text` laid out in `widget`; no frame means unconstrained
    [[nodiscard]] virtual Size text_size(const std::string& text, WidgetHandle widget,
                                         std::optional<Size> proposed_frame,
                                         const Environment& environment) = 0;

    // -------------------------------------------------------------------------
    // Button
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_button() = 0;
    virtual void update_button(WidgetHandle widget, const std::string& label,
                               const Environment& environment) = 0;
    virtual void set_button_action(WidgetHandle widget, std::function<void()> action) = 0;

    // -------------------------------------------------------------------------
    // Image
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_image_view() = 0;
    virtual void update_image_view(WidgetHandle widget, const RgbaImage& image, Size size,
                                   double scale_factor) = 0;
    [[nodiscard]] virtual bool requires_image_update_on_scale_factor_change() const = 0;

    // -------------------------------------------------------------------------
    // Scrolling
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_scroll_container(WidgetHandle content) = 0;
    virtual void set_scroll_bar_presence(WidgetHandle widget, bool has_vertical_scroll_bar,
                                         bool has_horizontal_scroll_bar) = 0;
    [[nodiscard]] virtual int scroll_bar_width() const = 0;

    // -------------------------------------------------------------------------
    // Picker
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_picker() = 0;
    virtual void update_picker(WidgetHandle widget, const std::vector<std::string>& options,
                               const Environment& environment) = 0;
    virtual void set_picker_change_handler(WidgetHandle widget,
                                           std::function<void(std::optional<std::size_t>)> handler) = 0;
    virtual void set_selected_option(WidgetHandle widget, std::optional<std::size_t> index) = 0;

    // -------------------------------------------------------------------------
    // Selectable list
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_selectable_list() = 0;
    /// Padding the toolkit forces around every row
    [[nodiscard]] virtual EdgeInsets base_item_padding(WidgetHandle widget) = 0;
    [[nodiscard]] virtual Size minimum_row_size(WidgetHandle widget) = 0;
    virtual void set_items(WidgetHandle widget, const std::vector<WidgetHandle>& rows,
                           const std::vector<int>& row_heights) = 0;
    virtual void set_selection_handler(WidgetHandle widget, std::function<void(std::size_t)> handler) = 0;
    virtual void set_selected_item(WidgetHandle widget, std::optional<std::size_t> index) = 0;

    // -------------------------------------------------------------------------
    // Progress
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_progress_bar() = 0;
    /// A missing fraction shows an indeterminate bar
    virtual void update_progress_bar(WidgetHandle widget, std::optional<double> fraction) = 0;
    [[nodiscard]] virtual WidgetHandle create_progress_spinner() = 0;

    // -------------------------------------------------------------------------
    // Paths
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual WidgetHandle create_path_widget() = 0;
    [[nodiscard]] virtual PathHandle create_path() = 0;
    /// `points_changed` is false when only the bounds moved
    virtual void update_path(PathHandle path, const Path& geometry, Rect bounds, bool points_changed) = 0;
    virtual void render_path(PathHandle path, WidgetHandle widget, std::optional<Color> fill,
                             std::optional<Color> stroke, const StrokeStyle& stroke_style) = 0;
    virtual void destroy_path(PathHandle path) = 0;
};

} // namespace loom_ui
