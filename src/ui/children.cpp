/// @file children.cpp
/// @brief Children storage implementations

#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

namespace loom_ui {

// =============================================================================
// ChildrenStorage
// =============================================================================

std::vector<WidgetHandle> ChildrenStorage::widgets() const {
    std::vector<WidgetHandle> result;
    for (auto* node : nodes()) {
        result.push_back(node->widget());
    }
    return result;
}

void ChildrenStorage::teardown() {
    for (auto* node : nodes()) {
        node->teardown();
    }
}

std::vector<NodeSnapshot> ChildrenStorage::snapshots() const {
    std::vector<NodeSnapshot> result;
    for (auto* node : nodes()) {
        result.push_back(node->snapshot());
    }
    return result;
}

LayoutResult ChildrenStorage::update_slot(std::unique_ptr<GraphNode>& slot, const AnyView& view, IBackend& backend,
                                          const SizeProposal& proposal, const Environment& environment,
                                          const NodeSnapshot* snapshot) {
    if (slot && slot->can_update_with(view)) {
        return slot->compute_layout(&view, proposal, environment);
    }

    if (slot) {
        loom_core::graph_logger()->debug("Replacing {} with {}", slot->view().name(), view.name());
        slot->teardown();
    }

    slot = std::make_unique<GraphNode>(view, backend, environment, snapshot);
    m_widgets_changed = true;
    return slot->compute_layout(nullptr, proposal, environment);
}

void sync_container_widgets(IBackend& backend, WidgetHandle container, ChildrenStorage& children) {
    if (!children.widgets_changed()) {
        return;
    }

    backend.remove_all_children(container);
    for (const auto& widget : children.widgets()) {
        backend.add_child(widget, container);
    }
    children.set_widgets_changed(false);
}

// =============================================================================
// TupleChildren
// =============================================================================

TupleChildren::TupleChildren(const std::vector<AnyView>& views, IBackend& backend,
                             const NodeSnapshot* snapshot, const Environment& environment)
    : m_backend(backend) {
    m_nodes.reserve(views.size());
    for (std::size_t i = 0; i < views.size(); ++i) {
        const NodeSnapshot* child_snapshot = snapshot ? snapshot->child(i, views[i].name()) : nullptr;
        m_nodes.push_back(std::make_unique<GraphNode>(views[i], backend, environment, child_snapshot));
    }
}

TupleChildren::~TupleChildren() = default;

std::vector<GraphNode*> TupleChildren::nodes() const {
    std::vector<GraphNode*> result;
    result.reserve(m_nodes.size());
    for (const auto& node : m_nodes) {
        result.push_back(node.get());
    }
    return result;
}

GraphNode& TupleChildren::node(std::size_t index) const {
    if (index >= m_nodes.size()) {
        loom_core::contract_violation("TupleChildren: child index " + std::to_string(index)
            + " out of range (" + std::to_string(m_nodes.size()) + " children)");
    }
    return *m_nodes[index];
}

LayoutResult TupleChildren::update_child(std::size_t index, const AnyView& view,
                                         const SizeProposal& proposal, const Environment& environment) {
    (void)node(index);
    return update_slot(m_nodes[index], view, m_backend, proposal, environment);
}

std::vector<LayoutableChild> TupleChildren::layoutable(const std::vector<AnyView>& views) {
    std::vector<LayoutableChild> result;
    result.reserve(views.size());
    for (std::size_t i = 0; i < views.size(); ++i) {
        result.push_back(LayoutableChild{
            [this, i, view = views[i]](const SizeProposal& proposal, const Environment& environment) {
                return update_child(i, view, proposal, environment);
            },
            [this, i]() { node(i).commit(); },
        });
    }
    return result;
}

// =============================================================================
// ErasedListChildren
// =============================================================================

ErasedListChildren::ErasedListChildren(IBackend& backend, const NodeSnapshot* snapshot)
    : m_backend(backend) {
    if (snapshot) {
        m_pending_snapshots = snapshot->children;
    }
}

ErasedListChildren::~ErasedListChildren() = default;

std::vector<GraphNode*> ErasedListChildren::nodes() const {
    std::vector<GraphNode*> result;
    result.reserve(m_nodes.size());
    for (const auto& node : m_nodes) {
        result.push_back(node.get());
    }
    return result;
}

GraphNode& ErasedListChildren::node(std::size_t index) const {
    if (index >= m_nodes.size()) {
        loom_core::contract_violation("ErasedListChildren: row " + std::to_string(index)
            + " out of range (" + std::to_string(m_nodes.size()) + " rows)");
    }
    return *m_nodes[index];
}

void ErasedListChildren::resize(const std::vector<AnyView>& views, const Environment& environment) {
    if (views.size() == m_nodes.size()) {
        return;
    }

    if (views.size() < m_nodes.size()) {
        loom_core::graph_logger()->debug("Truncating list from {} to {} rows", m_nodes.size(), views.size());
        while (m_nodes.size() > views.size()) {
            m_nodes.back()->teardown();
            m_nodes.pop_back();
        }
    } else {
        loom_core::graph_logger()->debug("Growing list from {} to {} rows", m_nodes.size(), views.size());
        for (std::size_t i = m_nodes.size(); i < views.size(); ++i) {
            const NodeSnapshot* snapshot = nullptr;
            if (i < m_pending_snapshots.size() && m_pending_snapshots[i].name == views[i].name()) {
                snapshot = &m_pending_snapshots[i];
            }
            m_nodes.push_back(std::make_unique<GraphNode>(views[i], m_backend, environment, snapshot));
        }
    }
    set_widgets_changed(true);
}

std::vector<AnyView> ErasedListChildren::views() const {
    std::vector<AnyView> result;
    result.reserve(m_nodes.size());
    for (const auto& node : m_nodes) {
        result.push_back(node->view());
    }
    return result;
}

LayoutResult ErasedListChildren::update_child(std::size_t index, const AnyView& view,
                                              const SizeProposal& proposal, const Environment& environment) {
    (void)node(index);
    return update_slot(m_nodes[index], view, m_backend, proposal, environment);
}

std::vector<LayoutableChild> ErasedListChildren::layoutable(const std::vector<AnyView>& views) {
    std::vector<LayoutableChild> result;
    result.reserve(views.size());
    for (std::size_t i = 0; i < views.size(); ++i) {
        result.push_back(LayoutableChild{
            [this, i, view = views[i]](const SizeProposal& proposal, const Environment& environment) {
                return update_child(i, view, proposal, environment);
            },
            [this, i]() { node(i).commit(); },
        });
    }
    return result;
}

} // namespace loom_ui
