#pragma once

/// @file children.hpp
/// @brief Storage for a graph node's child nodes
///
/// Each view kind decides the shape of its children storage:
///
/// | Storage               | Used by                                  |
/// |-----------------------|------------------------------------------|
/// | `EmptyChildren`       | leaf views                               |
/// | `TupleChildren`       | stacks, modifiers, conditionals          |
/// | `ErasedListChildren`  | `ForEach`, `List` rows                   |
/// | view-specific         | images, shapes, scroll views, composites |
///
/// Storage keeps its child nodes and their widgets in lockstep. Whenever a
/// node is replaced, added or dropped the storage raises `widgets_changed`
/// so the owning container re-adds its widgets during commit.

#include "graph_node.hpp"
#include "snapshot.hpp"
#include "view.hpp"

#include <loom/core/error.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

namespace loom_ui {

// =============================================================================
// ChildrenStorage
// =============================================================================

class ChildrenStorage {
public:
    virtual ~ChildrenStorage() = default;

    ChildrenStorage(const ChildrenStorage&) = delete;
    ChildrenStorage& operator=(const ChildrenStorage&) = delete;

    /// Child nodes in widget order
    [[nodiscard]] virtual std::vector<GraphNode*> nodes() const { return {}; }

    /// Widgets the owning container displays, in order
    [[nodiscard]] virtual std::vector<WidgetHandle> widgets() const;

    /// Tear down child nodes and release storage-owned backend resources
    virtual void teardown();

    /// Node-local state recorded in snapshots
    [[nodiscard]] virtual nlohmann::json state() const { return nullptr; }

    /// Snapshots of every child node
    [[nodiscard]] std::vector<NodeSnapshot> snapshots() const;

    [[nodiscard]] bool widgets_changed() const noexcept { return m_widgets_changed; }
    void set_widgets_changed(bool changed) noexcept { m_widgets_changed = changed; }

protected:
    ChildrenStorage() = default;

    /// Update the node in `slot` with `view`, replacing it when the kinds differ
    LayoutResult update_slot(std::unique_ptr<GraphNode>& slot, const AnyView& view, IBackend& backend,
                             const SizeProposal& proposal, const Environment& environment,
                             const NodeSnapshot* snapshot = nullptr);

private:
    bool m_widgets_changed = false;
};

/// Typed access to a view's own storage; a mismatch is a contract violation
template<typename Storage>
[[nodiscard]] Storage& storage_cast(ChildrenStorage& children) {
    auto* storage = dynamic_cast<Storage*>(&children);
    if (storage == nullptr) {
        loom_core::contract_violation(std::string("children storage is not a ") + typeid(Storage).name());
    }
    return *storage;
}

/// Re-add the storage's widgets to `container` if they changed since the last commit
void sync_container_widgets(IBackend& backend, WidgetHandle container, ChildrenStorage& children);

// =============================================================================
// EmptyChildren
// =============================================================================

class EmptyChildren : public ChildrenStorage {
public:
    EmptyChildren() = default;
};

// =============================================================================
// TupleChildren
// =============================================================================

/// A fixed list of child nodes matched positionally with the view's children
class TupleChildren : public ChildrenStorage {
public:
    TupleChildren(const std::vector<AnyView>& views, IBackend& backend,
                  const NodeSnapshot* snapshot, const Environment& environment);
    ~TupleChildren() override;

    [[nodiscard]] std::vector<GraphNode*> nodes() const override;

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] GraphNode& node(std::size_t index) const;

    /// Update child `index` with its new view and lay it out
    LayoutResult update_child(std::size_t index, const AnyView& view,
                              const SizeProposal& proposal, const Environment& environment);

    /// Children exposed to the layout system, one per view
    [[nodiscard]] std::vector<LayoutableChild> layoutable(const std::vector<AnyView>& views);

private:
    IBackend& m_backend;
    std::vector<std::unique_ptr<GraphNode>> m_nodes;
};

// =============================================================================
// ErasedListChildren
// =============================================================================

/// A variable number of child nodes, grown and truncated by position
class ErasedListChildren : public ChildrenStorage {
public:
    ErasedListChildren(IBackend& backend, const NodeSnapshot* snapshot);
    ~ErasedListChildren() override;

    [[nodiscard]] std::vector<GraphNode*> nodes() const override;

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] GraphNode& node(std::size_t index) const;

    /// Match the node count to `views`: trailing nodes are torn down, missing
    /// ones created. Existing nodes are kept by position.
    void resize(const std::vector<AnyView>& views, const Environment& environment);

    /// Views currently held by the row nodes
    [[nodiscard]] std::vector<AnyView> views() const;

    LayoutResult update_child(std::size_t index, const AnyView& view,
                              const SizeProposal& proposal, const Environment& environment);

    [[nodiscard]] std::vector<LayoutableChild> layoutable(const std::vector<AnyView>& views);

private:
    IBackend& m_backend;
    std::vector<std::unique_ptr<GraphNode>> m_nodes;
    std::vector<NodeSnapshot> m_pending_snapshots;
};

} // namespace loom_ui
