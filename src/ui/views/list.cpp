/// @file list.cpp
/// @brief Selectable lists and ForEach

#include <loom/ui/views/list.hpp>

#include <loom/ui/children.hpp>
#include <loom/ui/layout_system.hpp>
#include <loom/ui/views/modifiers.hpp>

#include <algorithm>

namespace loom_ui {

namespace {

constexpr int k_row_vertical_padding = 6;
constexpr int k_row_horizontal_padding = 8;

} // anonymous namespace

// =============================================================================
// List
// =============================================================================

std::unique_ptr<ChildrenStorage> List::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& /*environment*/) const {
    return std::make_unique<ErasedListChildren>(backend, snapshot);
}

WidgetHandle List::as_widget(ChildrenStorage& /*children*/, IBackend& backend) const {
    return backend.create_selectable_list();
}

LayoutResult List::compute_layout(
    WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& backend) const {
    auto& rows = storage_cast<ErasedListChildren>(children);

    // Padding the toolkit applies around every row whether we like it or not
    const EdgeInsets base = backend.base_item_padding(widget);
    const Size minimum_row = backend.minimum_row_size(widget);
    const int horizontal_base = base.horizontal();
    const int vertical_base = base.vertical();

    const EdgeInsets row_insets{
        std::max(k_row_vertical_padding - base.top, 0),
        std::max(k_row_horizontal_padding - base.leading, 0),
        std::max(k_row_vertical_padding - base.bottom, 0),
        std::max(k_row_horizontal_padding - base.trailing, 0),
    };

    std::vector<AnyView> row_views;
    row_views.reserve(m_row_count);
    for (std::size_t i = 0; i < m_row_count; ++i) {
        row_views.push_back(m_row_content(i).padding(row_insets));
    }
    rows.resize(row_views, environment);

    const SizeProposal row_proposal = proposal.width
        ? SizeProposal{std::max(*proposal.width, minimum_row.width) - horizontal_base, std::nullopt}
        : SizeProposal::ideal();

    std::vector<LayoutResult> results;
    results.reserve(row_views.size());
    for (std::size_t i = 0; i < row_views.size(); ++i) {
        results.push_back(rows.update_child(i, row_views[i], row_proposal, environment));
    }

    int widest = 0;
    int widest_ideal = 0;
    int widest_minimum = 0;
    int height = 0;
    for (const auto& result : results) {
        widest = std::max(widest, result.size.size.width);
        widest_ideal = std::max(widest_ideal, result.size.ideal_size.width);
        widest_minimum = std::max(widest_minimum, result.size.minimum_width);
        height += std::max(result.size.size.height + vertical_base, minimum_row.height);
    }

    const int inferred_width = widest + horizontal_base;
    const int ideal_width = widest_ideal + horizontal_base;
    const Size size{
        std::max(inferred_width, std::max(minimum_row.width, proposal.width.value_or(ideal_width))),
        height,
    };

    return LayoutResult{
        ViewSize(size, Size{ideal_width, height}, widest_minimum + horizontal_base, height, std::nullopt, height),
        std::move(results),
        true,
    };
}

void List::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    auto& rows = storage_cast<ErasedListChildren>(children);
    const int vertical_base = backend.base_item_padding(widget).vertical();

    std::vector<int> row_heights;
    row_heights.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        rows.node(i).commit();
        row_heights.push_back(layout.child_results[i].size.size.height + vertical_base);
    }

    backend.set_items(widget, rows.widgets(), row_heights);
    rows.set_widgets_changed(false);
    backend.set_size(widget, layout.size.size);

    const auto row_count = m_row_count;
    auto selection = m_selection;
    backend.set_selection_handler(widget, [selection, row_count](std::size_t index) {
        if (index < row_count) {
            selection.set(index);
        }
    });

    auto selected = m_selection.get();
    if (selected && *selected >= m_row_count) {
        selected.reset();
    }
    backend.set_selected_item(widget, selected);
}

// =============================================================================
// ForEach
// =============================================================================

std::vector<AnyView> ForEach::build() const {
    std::vector<AnyView> views;
    views.reserve(m_count);
    for (std::size_t i = 0; i < m_count; ++i) {
        views.push_back(m_content(i));
    }
    return views;
}

std::unique_ptr<ChildrenStorage> ForEach::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& /*environment*/) const {
    return std::make_unique<ErasedListChildren>(backend, snapshot);
}

std::vector<LayoutableChild> ForEach::layoutable_children(IBackend& /*backend*/, ChildrenStorage& children) const {
    auto& rows = storage_cast<ErasedListChildren>(children);
    return rows.layoutable(rows.views());
}

WidgetHandle ForEach::as_widget(ChildrenStorage& /*children*/, IBackend& backend) const {
    return backend.create_container();
}

LayoutResult ForEach::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    auto& rows = storage_cast<ErasedListChildren>(children);
    const auto views = build();
    rows.resize(views, environment);
    return LayoutSystem::compute_stack_layout(
        rows.layoutable(views), proposal, environment,
        environment.layout_orientation(), environment.layout_spacing());
}

void ForEach::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& environment, IBackend& backend) const {
    sync_container_widgets(backend, widget, children);
    LayoutSystem::commit_stack_layout(
        widget, layoutable_children(backend, children), layout,
        environment.layout_orientation(), environment.layout_alignment(), environment.layout_spacing(), backend);
}

} // namespace loom_ui
