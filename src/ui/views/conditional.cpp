/// @file conditional.cpp
/// @brief Empty and conditional views

#include <loom/ui/views/conditional.hpp>

#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

#include <map>

namespace loom_ui {

// =============================================================================
// EmptyView
// =============================================================================

WidgetHandle EmptyView::create_widget(IBackend& backend) const {
    return backend.create_container();
}

LayoutResult EmptyView::layout_leaf(WidgetHandle /*widget*/, const SizeProposal& /*proposal*/,
                                    const Environment& /*environment*/, IBackend& /*backend*/) const {
    return LayoutResult{ViewSize::empty(), {}, false};
}

void EmptyView::commit_leaf(WidgetHandle /*widget*/, const LayoutResult& /*layout*/,
                            const Environment& /*environment*/, IBackend& /*backend*/) const {}

// =============================================================================
// EitherView
// =============================================================================

namespace {

class EitherChildren : public ChildrenStorage {
public:
    EitherChildren(bool branch, const AnyView& view, IBackend& backend,
                   const NodeSnapshot* snapshot, const Environment& environment)
        : m_backend(backend), m_branch(branch) {
        const NodeSnapshot* child_snapshot = snapshot ? snapshot->child(0, view.name()) : nullptr;
        m_node = std::make_unique<GraphNode>(view, backend, environment, child_snapshot);
    }

    [[nodiscard]] std::vector<GraphNode*> nodes() const override { return {m_node.get()}; }

    [[nodiscard]] GraphNode& node() const { return *m_node; }

    LayoutResult update(bool branch, const AnyView& view, const SizeProposal& proposal,
                        const Environment& environment) {
        if (branch == m_branch) {
            return update_slot(m_node, view, m_backend, proposal, environment);
        }

        loom_core::graph_logger()->debug("Switching branch to {}", branch ? "true" : "false");
        m_saved[m_branch] = m_node->snapshot();
        m_node->teardown();
        m_node.reset();

        const NodeSnapshot* snapshot = nullptr;
        auto saved = m_saved.find(branch);
        if (saved != m_saved.end() && saved->second.name == view.name()) {
            snapshot = &saved->second;
        }

        m_branch = branch;
        m_node = std::make_unique<GraphNode>(view, m_backend, environment, snapshot);
        set_widgets_changed(true);
        return m_node->compute_layout(nullptr, proposal, environment);
    }

private:
    IBackend& m_backend;
    bool m_branch;
    std::unique_ptr<GraphNode> m_node;
    std::map<bool, NodeSnapshot> m_saved;
};

} // anonymous namespace

std::unique_ptr<ChildrenStorage> EitherView::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<EitherChildren>(m_condition, active(), backend, snapshot, environment);
}

WidgetHandle EitherView::as_widget(ChildrenStorage& children, IBackend& backend) const {
    const auto container = backend.create_container();
    backend.add_child(storage_cast<EitherChildren>(children).node().widget(), container);
    return container;
}

LayoutResult EitherView::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    auto child = storage_cast<EitherChildren>(children).update(m_condition, active(), proposal, environment);
    const bool participates = child.participates_in_stack_layouts;
    auto size = child.size;
    return LayoutResult{size, {std::move(child)}, participates};
}

void EitherView::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    auto& storage = storage_cast<EitherChildren>(children);
    sync_container_widgets(backend, widget, storage);
    storage.node().commit();
    backend.set_position(widget, 0, Point{});
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// OptionalView
// =============================================================================

OptionalView::OptionalView(std::optional<AnyView> content)
    : EitherView(content.has_value(), content.value_or(AnyView(EmptyView{})), AnyView(EmptyView{})) {}

} // namespace loom_ui
