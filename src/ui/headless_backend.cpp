/// @file headless_backend.cpp
/// @brief In-memory backend implementation

#include <loom/ui/headless_backend.hpp>

#include <loom/core/error.hpp>
#include <loom/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace loom_ui {

// =============================================================================
// Text Layout Helpers
// =============================================================================

namespace {

/// Split into paragraphs on newlines, then into words on spaces
std::vector<std::vector<std::string>> split_paragraphs(const std::string& text) {
    std::vector<std::vector<std::string>> paragraphs;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        std::vector<std::string> words;
        std::istringstream tokens(line);
        std::string word;
        while (tokens >> word) {
            words.push_back(word);
        }
        paragraphs.push_back(std::move(words));
    }
    if (!text.empty() && text.back() == '\n') {
        paragraphs.emplace_back();
    }
    if (paragraphs.empty()) {
        paragraphs.emplace_back();
    }
    return paragraphs;
}

} // anonymous namespace

HeadlessOptions HeadlessOptions::from_config(const EngineConfig& config) {
    HeadlessOptions options;
    options.calibration = config.calibration;
    options.color_scheme = config.environment.color_scheme;
    options.light_foreground = config.environment.light_foreground;
    options.dark_foreground = config.environment.dark_foreground;
    return options;
}

// =============================================================================
// HeadlessBackend
// =============================================================================

HeadlessBackend::HeadlessBackend(HeadlessOptions options)
    : m_options(std::move(options)) {}

int HeadlessBackend::char_width(const Font& font) const {
    return std::max(1, static_cast<int>(std::lround(m_options.metrics.char_width * font.size / 12.0)));
}

int HeadlessBackend::line_height(const Font& font) const {
    return std::max(1, static_cast<int>(std::lround(m_options.metrics.line_height * font.size / 12.0)));
}

Size HeadlessBackend::layout_text(const std::string& text, const Font& font, std::optional<int> max_width) const {
    const int advance = char_width(font);
    const int space = advance;
    int width = 0;
    int lines = 0;

    for (const auto& words : split_paragraphs(text)) {
        int line_width = 0;
        ++lines;
        for (const auto& word : words) {
            const int word_width = static_cast<int>(word.size()) * advance;
            if (line_width == 0) {
                line_width = word_width;
            } else if (max_width && line_width + space + word_width > *max_width) {
                width = std::max(width, line_width);
                ++lines;
                line_width = word_width;
            } else {
                line_width += space + word_width;
            }
        }
        width = std::max(width, line_width);
    }

    return Size{width, lines * line_height(font)};
}

int HeadlessBackend::longest_word_width(const std::string& text, const Font& font) const {
    return layout_text(text, font, 1).width;
}

HeadlessWidget& HeadlessBackend::lookup(WidgetHandle handle, const char* operation) {
    auto it = m_widgets.find(handle.id);
    if (it == m_widgets.end()) {
        loom_core::contract_violation(
            std::string(operation) + " called with unknown widget #" + std::to_string(handle.id));
    }
    return it->second;
}

const HeadlessWidget* HeadlessBackend::find(WidgetHandle handle) const {
    auto it = m_widgets.find(handle.id);
    return it != m_widgets.end() ? &it->second : nullptr;
}

const HeadlessWidget& HeadlessBackend::widget(WidgetHandle handle) const {
    const auto* found = find(handle);
    if (!found) {
        loom_core::contract_violation("No live widget #" + std::to_string(handle.id));
    }
    return *found;
}

WidgetHandle HeadlessBackend::create(HeadlessWidgetKind kind) {
    WidgetHandle handle{m_next_widget_id++};
    HeadlessWidget w;
    w.handle = handle;
    w.kind = kind;
    m_widgets.emplace(handle.id, std::move(w));
    ++m_created[kind];
    loom_core::backend_logger()->trace("Created {} #{}", to_string(kind), handle.id);
    return handle;
}

void HeadlessBackend::detach(HeadlessWidget& child) {
    if (!child.parent.is_valid()) {
        return;
    }
    auto parent_it = m_widgets.find(child.parent.id);
    if (parent_it != m_widgets.end()) {
        auto& parent = parent_it->second;
        for (std::size_t i = 0; i < parent.children.size(); ++i) {
            if (parent.children[i] == child.handle) {
                parent.children.erase(parent.children.begin() + static_cast<std::ptrdiff_t>(i));
                parent.positions.erase(parent.positions.begin() + static_cast<std::ptrdiff_t>(i));
                break;
            }
        }
    }
    child.parent = WidgetHandle{};
}

std::size_t HeadlessBackend::created_count(HeadlessWidgetKind kind) const {
    auto it = m_created.find(kind);
    return it != m_created.end() ? it->second : 0;
}

std::size_t HeadlessBackend::created_count() const {
    std::size_t total = 0;
    for (const auto& [kind, count] : m_created) {
        total += count;
    }
    return total;
}

Point HeadlessBackend::position_of(WidgetHandle child) const {
    const auto& w = widget(child);
    const auto& parent = widget(w.parent);
    for (std::size_t i = 0; i < parent.children.size(); ++i) {
        if (parent.children[i] == child) {
            return parent.positions[i];
        }
    }
    return Point{};
}

// -----------------------------------------------------------------------------
// Environment & scheduling
// -----------------------------------------------------------------------------

Environment HeadlessBackend::compute_root_environment(const Environment& defaults) {
    const Color foreground = m_options.color_scheme == ColorScheme::Dark
        ? m_options.dark_foreground
        : m_options.light_foreground;
    return defaults
        .with(&EnvironmentValues::color_scheme, m_options.color_scheme)
        .with(&EnvironmentValues::foreground_color, foreground)
        .with(&EnvironmentValues::window_scale_factor, m_options.scale_factor)
        .with(&EnvironmentValues::window, WindowHandle{1})
        .scoped();
}

SubscriptionId HeadlessBackend::subscribe_root_environment_change(std::function<void()> handler) {
    SubscriptionId id{m_next_subscription_id++};
    m_root_environment_handlers.emplace_back(id, std::move(handler));
    return id;
}

bool HeadlessBackend::unsubscribe_root_environment_change(SubscriptionId id) {
    auto it = std::find_if(m_root_environment_handlers.begin(), m_root_environment_handlers.end(),
        [id](const auto& entry) { return entry.first == id; });
    if (it == m_root_environment_handlers.end()) {
        return false;
    }
    m_root_environment_handlers.erase(it);
    return true;
}

void HeadlessBackend::notify_root_environment_change() {
    // Handlers may unsubscribe while running
    const auto handlers = m_root_environment_handlers;
    for (const auto& [id, handler] : handlers) {
        if (handler) {
            handler();
        }
    }
}

void HeadlessBackend::run_in_main_thread(std::function<void()> action) {
    m_main_thread_queue.push_back(std::move(action));
}

std::size_t HeadlessBackend::drain_main_thread() {
    std::size_t ran = 0;
    while (!m_main_thread_queue.empty()) {
        auto action = std::move(m_main_thread_queue.front());
        m_main_thread_queue.pop_front();
        action();
        ++ran;
    }
    return ran;
}

void HeadlessBackend::set_color_scheme(ColorScheme scheme) {
    if (m_options.color_scheme == scheme) {
        return;
    }
    m_options.color_scheme = scheme;
    loom_core::backend_logger()->debug("Color scheme switched to {}", to_string(scheme));
    notify_root_environment_change();
}

void HeadlessBackend::set_scale_factor(double scale_factor) {
    m_options.scale_factor = scale_factor;
    notify_root_environment_change();
}

// -----------------------------------------------------------------------------
// Widget lifetime
// -----------------------------------------------------------------------------

void HeadlessBackend::destroy_widget(WidgetHandle handle) {
    auto& w = lookup(handle, "destroy_widget");
    detach(w);
    for (const auto& child : w.children) {
        auto it = m_widgets.find(child.id);
        if (it != m_widgets.end()) {
            it->second.parent = WidgetHandle{};
        }
    }

    m_button_actions.erase(handle.id);
    m_picker_handlers.erase(handle.id);
    m_selection_handlers.erase(handle.id);

    loom_core::backend_logger()->trace("Destroyed {} #{}", to_string(w.kind), handle.id);
    m_widgets.erase(handle.id);
    ++m_destroyed;
}

// -----------------------------------------------------------------------------
// Containers & geometry
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_container() {
    return create(HeadlessWidgetKind::Container);
}

void HeadlessBackend::add_child(WidgetHandle child, WidgetHandle container) {
    auto& c = lookup(child, "add_child");
    detach(c);
    auto& parent = lookup(container, "add_child");
    parent.children.push_back(child);
    parent.positions.push_back(Point{});
    c.parent = container;
}

void HeadlessBackend::remove_child(WidgetHandle child, WidgetHandle container) {
    auto& c = lookup(child, "remove_child");
    if (c.parent != container) {
        loom_core::contract_violation("remove_child: widget #" + std::to_string(child.id)
            + " is not a child of #" + std::to_string(container.id));
    }
    detach(c);
}

void HeadlessBackend::remove_all_children(WidgetHandle container) {
    auto& parent = lookup(container, "remove_all_children");
    for (const auto& child : parent.children) {
        auto it = m_widgets.find(child.id);
        if (it != m_widgets.end()) {
            it->second.parent = WidgetHandle{};
        }
    }
    parent.children.clear();
    parent.positions.clear();
}

void HeadlessBackend::set_position(WidgetHandle container, std::size_t child_index, Point position) {
    auto& parent = lookup(container, "set_position");
    if (child_index >= parent.children.size()) {
        loom_core::contract_violation("set_position: child index " + std::to_string(child_index)
            + " out of range for container #" + std::to_string(container.id)
            + " with " + std::to_string(parent.children.size()) + " children");
    }
    parent.positions[child_index] = position;
}

Size HeadlessBackend::natural_size(WidgetHandle handle) {
    const auto& w = lookup(handle, "natural_size");
    const auto& cal = m_options.calibration;

    switch (w.kind) {
        case HeadlessWidgetKind::Text:
            return layout_text(w.text, w.font, std::nullopt);
        case HeadlessWidgetKind::Button:
            return layout_text(w.text, w.font, std::nullopt) + cal.button_padding;
        case HeadlessWidgetKind::Picker: {
            if (cal.picker_natural_size_unavailable) {
                return Size{-1, -1};
            }
            int widest = 0;
            for (const auto& option : w.options) {
                widest = std::max(widest, layout_text(option, w.font, std::nullopt).width);
            }
            const int height = std::max(line_height(w.font) + cal.picker_vertical_padding,
                                        cal.picker_minimum_height);
            return Size{widest + cal.picker_extra_width, height};
        }
        case HeadlessWidgetKind::ImageView:
            return w.image_size.value_or(Size::zero());
        case HeadlessWidgetKind::ProgressBar:
            return Size{100, cal.progress_bar_height};
        case HeadlessWidgetKind::ProgressSpinner:
            return cal.progress_spinner_size;
        default:
            return w.size;
    }
}

void HeadlessBackend::set_size(WidgetHandle widget, Size size) {
    lookup(widget, "set_size").size = size;
}

Measurement HeadlessBackend::measure(WidgetHandle handle, Orientation orientation, int perpendicular_length) {
    const auto& w = lookup(handle, "measure");
    if (w.kind == HeadlessWidgetKind::Text || w.kind == HeadlessWidgetKind::Button) {
        if (orientation == Orientation::Vertical) {
            const int height = layout_text(w.text, w.font, std::max(perpendicular_length, 1)).height;
            return Measurement{height, height};
        }
        return Measurement{
            longest_word_width(w.text, w.font),
            layout_text(w.text, w.font, std::nullopt).width,
        };
    }

    const Size natural = natural_size(handle);
    const int length = orientation == Orientation::Horizontal ? natural.width : natural.height;
    return Measurement{length, length};
}

// -----------------------------------------------------------------------------
// Text & buttons
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_text_view() {
    return create(HeadlessWidgetKind::Text);
}

void HeadlessBackend::update_text_view(WidgetHandle widget, const std::string& content,
                                       const Environment& environment) {
    auto& w = lookup(widget, "update_text_view");
    w.text = content;
    w.font = environment.font();
    ++w.text_updates;
}

Size HeadlessBackend::text_size(const std::string& text, WidgetHandle widget,
                                std::optional<Size> proposed_frame, const Environment& environment) {
    // The widget only has to exist; metrics come from the environment font
    (void)lookup(widget, "text_size");
    if (!proposed_frame) {
        return layout_text(text, environment.font(), std::nullopt);
    }
    return layout_text(text, environment.font(), std::max(proposed_frame->width, 1));
}

WidgetHandle HeadlessBackend::create_button() {
    return create(HeadlessWidgetKind::Button);
}

void HeadlessBackend::update_button(WidgetHandle widget, const std::string& label,
                                    const Environment& environment) {
    auto& w = lookup(widget, "update_button");
    w.text = label;
    w.font = environment.font();
    ++w.text_updates;
}

void HeadlessBackend::set_button_action(WidgetHandle widget, std::function<void()> action) {
    (void)lookup(widget, "set_button_action");
    m_button_actions[widget.id] = std::move(action);
}

bool HeadlessBackend::click(WidgetHandle button) {
    auto it = m_button_actions.find(button.id);
    if (it == m_button_actions.end() || !it->second) {
        return false;
    }
    // The action may destroy the button
    auto action = it->second;
    action();
    return true;
}

// -----------------------------------------------------------------------------
// Images
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_image_view() {
    return create(HeadlessWidgetKind::ImageView);
}

void HeadlessBackend::update_image_view(WidgetHandle widget, const RgbaImage& image, Size size,
                                        double scale_factor) {
    auto& w = lookup(widget, "update_image_view");
    w.image_size = image.size();
    w.size = size;
    w.image_scale_factor = scale_factor;
    ++w.image_updates;
}

// -----------------------------------------------------------------------------
// Scrolling
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_scroll_container(WidgetHandle content) {
    WidgetHandle scroll = create(HeadlessWidgetKind::ScrollContainer);
    add_child(content, scroll);
    return scroll;
}

void HeadlessBackend::set_scroll_bar_presence(WidgetHandle widget, bool has_vertical_scroll_bar,
                                              bool has_horizontal_scroll_bar) {
    auto& w = lookup(widget, "set_scroll_bar_presence");
    w.has_vertical_scroll_bar = has_vertical_scroll_bar;
    w.has_horizontal_scroll_bar = has_horizontal_scroll_bar;
}

// -----------------------------------------------------------------------------
// Pickers
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_picker() {
    return create(HeadlessWidgetKind::Picker);
}

void HeadlessBackend::update_picker(WidgetHandle widget, const std::vector<std::string>& options,
                                    const Environment& environment) {
    auto& w = lookup(widget, "update_picker");
    w.options = options;
    w.font = environment.font();
}

void HeadlessBackend::set_picker_change_handler(WidgetHandle widget,
                                                std::function<void(std::optional<std::size_t>)> handler) {
    (void)lookup(widget, "set_picker_change_handler");
    m_picker_handlers[widget.id] = std::move(handler);
}

void HeadlessBackend::set_selected_option(WidgetHandle widget, std::optional<std::size_t> index) {
    auto& w = lookup(widget, "set_selected_option");
    w.selected = (index && *index < w.options.size()) ? index : std::nullopt;
}

bool HeadlessBackend::choose_option(WidgetHandle picker, std::optional<std::size_t> index) {
    auto& w = lookup(picker, "choose_option");
    w.selected = index;
    auto it = m_picker_handlers.find(picker.id);
    if (it == m_picker_handlers.end() || !it->second) {
        return false;
    }
    auto handler = it->second;
    handler(index);
    return true;
}

// -----------------------------------------------------------------------------
// Selectable lists
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_selectable_list() {
    return create(HeadlessWidgetKind::SelectableList);
}

EdgeInsets HeadlessBackend::base_item_padding(WidgetHandle widget) {
    (void)lookup(widget, "base_item_padding");
    return m_options.metrics.base_item_padding;
}

Size HeadlessBackend::minimum_row_size(WidgetHandle widget) {
    (void)lookup(widget, "minimum_row_size");
    return m_options.metrics.minimum_row_size;
}

void HeadlessBackend::set_items(WidgetHandle widget, const std::vector<WidgetHandle>& rows,
                                const std::vector<int>& row_heights) {
    remove_all_children(widget);
    for (const auto& row : rows) {
        add_child(row, widget);
    }
    auto& list = lookup(widget, "set_items");
    int y = 0;
    for (std::size_t i = 0; i < rows.size() && i < row_heights.size(); ++i) {
        list.positions[i] = Point{0, y};
        y += row_heights[i];
    }
    list.row_heights = row_heights;
}

void HeadlessBackend::set_selection_handler(WidgetHandle widget, std::function<void(std::size_t)> handler) {
    (void)lookup(widget, "set_selection_handler");
    m_selection_handlers[widget.id] = std::move(handler);
}

void HeadlessBackend::set_selected_item(WidgetHandle widget, std::optional<std::size_t> index) {
    lookup(widget, "set_selected_item").selected = index;
}

bool HeadlessBackend::select_row(WidgetHandle list, std::size_t index) {
    auto& w = lookup(list, "select_row");
    w.selected = index;
    auto it = m_selection_handlers.find(list.id);
    if (it == m_selection_handlers.end() || !it->second) {
        return false;
    }
    auto handler = it->second;
    handler(index);
    return true;
}

// -----------------------------------------------------------------------------
// Progress
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_progress_bar() {
    return create(HeadlessWidgetKind::ProgressBar);
}

void HeadlessBackend::update_progress_bar(WidgetHandle widget, std::optional<double> fraction) {
    lookup(widget, "update_progress_bar").progress = fraction;
}

WidgetHandle HeadlessBackend::create_progress_spinner() {
    return create(HeadlessWidgetKind::ProgressSpinner);
}

// -----------------------------------------------------------------------------
// Paths
// -----------------------------------------------------------------------------

WidgetHandle HeadlessBackend::create_path_widget() {
    return create(HeadlessWidgetKind::PathWidget);
}

PathHandle HeadlessBackend::create_path() {
    PathHandle handle{m_next_path_id++};
    m_paths.insert(handle.id);
    return handle;
}

void HeadlessBackend::update_path(PathHandle path, const Path& /*geometry*/, Rect /*bounds*/, bool points_changed) {
    if (!m_paths.contains(path.id)) {
        loom_core::contract_violation("update_path called with unknown path #" + std::to_string(path.id));
    }
    ++m_path_updates;
    if (points_changed) {
        ++m_path_point_updates;
    }
}

void HeadlessBackend::render_path(PathHandle path, WidgetHandle widget, std::optional<Color> fill,
                                  std::optional<Color> stroke, const StrokeStyle& /*stroke_style*/) {
    auto& w = lookup(widget, "render_path");
    w.rendered_path = path;
    w.fill = fill;
    w.stroke = stroke;
    ++w.path_renders;
}

void HeadlessBackend::destroy_path(PathHandle path) {
    m_paths.erase(path.id);
}

} // namespace loom_ui
