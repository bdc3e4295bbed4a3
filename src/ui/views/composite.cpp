/// @file composite.cpp
/// @brief Composite views

#include <loom/ui/views/composite.hpp>

#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

namespace loom_ui {

namespace {

/// JSON state of a composite node and the node of its body
class CompositeChildren : public ChildrenStorage {
public:
    CompositeChildren(const CompositeView& view, IBackend& backend, const NodeSnapshot* snapshot,
                      const Environment& environment)
        : m_backend(backend) {
        if (snapshot && !snapshot->state.is_null()) {
            m_state = std::make_shared<nlohmann::json>(snapshot->state);
            loom_core::graph_logger()->debug("Restored state of {} from snapshot", view.name());
        } else {
            m_state = std::make_shared<nlohmann::json>(view.initial_state());
        }

        ViewContext context(m_state, environment);
        const auto body = view.body(context);
        const NodeSnapshot* body_snapshot = snapshot ? snapshot->child(0, body.name()) : nullptr;
        m_body = std::make_unique<GraphNode>(body, backend, environment, body_snapshot);
    }

    [[nodiscard]] std::vector<GraphNode*> nodes() const override { return {m_body.get()}; }
    [[nodiscard]] nlohmann::json state() const override { return *m_state; }

    [[nodiscard]] GraphNode& body() const { return *m_body; }
    [[nodiscard]] const std::shared_ptr<nlohmann::json>& shared_state() const noexcept { return m_state; }

    LayoutResult update_body(const AnyView& view, const SizeProposal& proposal, const Environment& environment) {
        return update_slot(m_body, view, m_backend, proposal, environment);
    }

private:
    IBackend& m_backend;
    std::shared_ptr<nlohmann::json> m_state;
    std::unique_ptr<GraphNode> m_body;
};

} // anonymous namespace

std::unique_ptr<ChildrenStorage> CompositeView::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<CompositeChildren>(*this, backend, snapshot, environment);
}

WidgetHandle CompositeView::as_widget(ChildrenStorage& children, IBackend& backend) const {
    auto& storage = storage_cast<CompositeChildren>(children);
    const auto container = backend.create_container();
    backend.add_child(storage.body().widget(), container);
    return container;
}

LayoutResult CompositeView::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    auto& storage = storage_cast<CompositeChildren>(children);
    ViewContext context(storage.shared_state(), environment);
    auto result = storage.update_body(body(context), proposal, environment);
    return LayoutResult{result.size, {result}, result.participates_in_stack_layouts};
}

void CompositeView::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    auto& storage = storage_cast<CompositeChildren>(children);
    sync_container_widgets(backend, widget, storage);
    storage.body().commit();
    backend.set_position(widget, 0, Point{});
    backend.set_size(widget, layout.size.size);
}

} // namespace loom_ui
