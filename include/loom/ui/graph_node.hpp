#pragma once

/// @file graph_node.hpp
/// @brief Persistent node pairing a view with its native widget

#include "backend.hpp"
#include "environment.hpp"
#include "view.hpp"
#include "view_size.hpp"

#include <memory>
#include <optional>

namespace loom_ui {

/// A graph node owns exactly one native widget and one children storage for
/// the view kind at its tree position. The widget is created once, in the
/// constructor, and reused for every later view of the same kind.
///
/// Teardown order: the children storage first (so outer disappear actions
/// run before inner ones), then the node's own widget.
class GraphNode {
public:
    GraphNode(AnyView view, IBackend& backend, const Environment& environment,
              const NodeSnapshot* snapshot = nullptr);
    ~GraphNode();

    GraphNode(const GraphNode&) = delete;
    GraphNode& operator=(const GraphNode&) = delete;

    /// True when `view` can replace the current view without a new widget
    [[nodiscard]] bool can_update_with(const AnyView& view) const;

    /// Store `new_view` (when given) and compute a layout for `proposal`.
    /// Passing a view of another kind is a contract violation; owners must
    /// replace the node instead.
    LayoutResult compute_layout(const AnyView* new_view, const SizeProposal& proposal,
                                const Environment& environment);

    /// Apply the last computed layout
    void commit();

    /// Release child nodes and the widget; idempotent
    void teardown();

    [[nodiscard]] NodeSnapshot snapshot() const;

    [[nodiscard]] WidgetHandle widget() const noexcept { return m_widget; }
    [[nodiscard]] const AnyView& view() const noexcept { return m_view; }
    [[nodiscard]] ChildrenStorage& children() const noexcept { return *m_children; }
    [[nodiscard]] const std::optional<LayoutResult>& current_layout() const noexcept { return m_layout; }
    [[nodiscard]] const Environment& environment() const noexcept { return m_environment; }
    [[nodiscard]] IBackend& backend() const noexcept { return m_backend; }
    [[nodiscard]] bool is_torn_down() const noexcept { return m_torn_down; }

private:
    AnyView m_view;
    IBackend& m_backend;
    Environment m_environment;
    std::unique_ptr<ChildrenStorage> m_children;
    WidgetHandle m_widget;
    std::optional<LayoutResult> m_layout;
    bool m_torn_down = false;
};

} // namespace loom_ui
