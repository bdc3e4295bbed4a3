/// @file stack.cpp
/// @brief Stack containers

#include <loom/ui/views/stack.hpp>

#include <loom/ui/children.hpp>
#include <loom/ui/layout_system.hpp>

namespace loom_ui {

namespace {

WidgetHandle container_with(const ChildrenStorage& children, IBackend& backend) {
    const auto container = backend.create_container();
    for (const auto& widget : children.widgets()) {
        backend.add_child(widget, container);
    }
    return container;
}

} // anonymous namespace

// =============================================================================
// StackView
// =============================================================================

StackView::StackView(Orientation orientation, std::vector<AnyView> children,
                     StackAlignment alignment, std::optional<int> spacing)
    : m_orientation(orientation)
    , m_children(std::move(children))
    , m_alignment(alignment)
    , m_spacing(spacing) {}

int StackView::resolved_spacing(const Environment& environment) const {
    return m_spacing.value_or(environment.layout_spacing());
}

Environment StackView::child_environment(const Environment& environment) const {
    return LayoutSystem::stack_environment(environment, m_orientation, m_alignment, resolved_spacing(environment));
}

std::unique_ptr<ChildrenStorage> StackView::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<TupleChildren>(m_children, backend, snapshot, child_environment(environment));
}

std::vector<LayoutableChild> StackView::layoutable_children(IBackend& /*backend*/, ChildrenStorage& children) const {
    return storage_cast<TupleChildren>(children).layoutable(m_children);
}

WidgetHandle StackView::as_widget(ChildrenStorage& children, IBackend& backend) const {
    return container_with(children, backend);
}

LayoutResult StackView::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& backend) const {
    return LayoutSystem::compute_stack_layout(
        layoutable_children(backend, children), proposal, child_environment(environment),
        m_orientation, resolved_spacing(environment));
}

void StackView::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& environment, IBackend& backend) const {
    sync_container_widgets(backend, widget, children);
    LayoutSystem::commit_stack_layout(
        widget, layoutable_children(backend, children), layout,
        m_orientation, m_alignment, resolved_spacing(environment), backend);
}

// =============================================================================
// ZStack
// =============================================================================

std::unique_ptr<ChildrenStorage> ZStack::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<TupleChildren>(m_children, backend, snapshot, environment);
}

std::vector<LayoutableChild> ZStack::layoutable_children(IBackend& /*backend*/, ChildrenStorage& children) const {
    return storage_cast<TupleChildren>(children).layoutable(m_children);
}

WidgetHandle ZStack::as_widget(ChildrenStorage& children, IBackend& backend) const {
    return container_with(children, backend);
}

LayoutResult ZStack::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& backend) const {
    return LayoutSystem::compute_overlay_layout(layoutable_children(backend, children), proposal, environment);
}

void ZStack::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    sync_container_widgets(backend, widget, children);
    LayoutSystem::commit_overlay_layout(widget, layoutable_children(backend, children), layout, m_alignment, backend);
}

} // namespace loom_ui
