/// @file graph_node.cpp
/// @brief GraphNode implementation

#include <loom/ui/graph_node.hpp>
#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

namespace loom_ui {

GraphNode::GraphNode(AnyView view, IBackend& backend, const Environment& environment,
                     const NodeSnapshot* snapshot)
    : m_view(std::move(view))
    , m_backend(backend)
    , m_environment(environment) {
    m_children = m_view->children(backend, snapshot, environment);
    m_widget = m_view->as_widget(*m_children, backend);
    loom_core::graph_logger()->debug("Created {} (widget #{})", m_view.name(), m_widget.id);
}

GraphNode::~GraphNode() {
    if (!m_torn_down) {
        teardown();
    }
}

bool GraphNode::can_update_with(const AnyView& view) const {
    return m_view.kind() == view.kind();
}

LayoutResult GraphNode::compute_layout(const AnyView* new_view, const SizeProposal& proposal,
                                       const Environment& environment) {
    if (m_torn_down) {
        loom_core::contract_violation("compute_layout on torn down node " + m_view.name());
    }
    if (new_view != nullptr) {
        if (!can_update_with(*new_view)) {
            loom_core::contract_violation("cannot update " + m_view.name() + " in place with " + new_view->name());
        }
        m_view = *new_view;
    }

    m_environment = environment;
    auto result = m_view->compute_layout(m_widget, *m_children, proposal, environment, m_backend);
    m_layout = result;
    return result;
}

void GraphNode::commit() {
    if (!m_layout) {
        loom_core::contract_violation("commit before compute_layout on " + m_view.name());
    }
    m_view->commit(m_widget, *m_children, *m_layout, m_environment, m_backend);
}

void GraphNode::teardown() {
    if (m_torn_down) {
        return;
    }
    m_torn_down = true;

    m_children->teardown();
    m_backend.destroy_widget(m_widget);
    loom_core::graph_logger()->debug("Tore down {} (widget #{})", m_view.name(), m_widget.id);
}

NodeSnapshot GraphNode::snapshot() const {
    return NodeSnapshot{m_view.name(), m_children->state(), m_children->snapshots()};
}

} // namespace loom_ui
