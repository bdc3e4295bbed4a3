#pragma once

/// @file view_graph.hpp
/// @brief Root of a rendered view tree
///
/// `ViewGraph` owns the root graph node, computes the root environment from
/// the backend and drives full update cycles:
///
/// ```
///  update(proposal) ──► root.compute_layout ──► (dry run? stop)
///                                           └─► root.commit
/// ```
///
/// State changes of composite views and root environment changes (theme,
/// scale factor) trigger a full update with the last committed proposal.
/// State changes are marshalled through `IBackend::run_in_main_thread`.

#include "config.hpp"
#include "graph_node.hpp"
#include "snapshot.hpp"
#include "view.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace loom_ui {

class ViewGraph {
public:
    /// Build the tree for `root`. A snapshot whose root name does not match
    /// the view is ignored with a warning.
    ViewGraph(AnyView root, IBackend& backend, const EngineConfig& config = EngineConfig::defaults(),
              const NodeSnapshot* snapshot = nullptr);
    ~ViewGraph();

    ViewGraph(const ViewGraph&) = delete;
    ViewGraph& operator=(const ViewGraph&) = delete;

    /// Lay out (and unless `dry_run`, commit) the current root
    LayoutResult update(const SizeProposal& proposal, bool dry_run = false);

    /// Replace the root view, then update. A root of another kind rebuilds
    /// the whole tree.
    LayoutResult update(AnyView new_root, const SizeProposal& proposal, bool dry_run = false);

    /// Capture the node tree, including composite view state
    [[nodiscard]] NodeSnapshot snapshot() const;

    [[nodiscard]] GraphNode& root_node() const noexcept { return *m_root; }
    [[nodiscard]] WidgetHandle root_widget() const noexcept { return m_root->widget(); }
    [[nodiscard]] const Environment& root_environment() const noexcept { return m_environment; }
    [[nodiscard]] IBackend& backend() const noexcept { return m_backend; }

    /// Committed (non dry-run) updates so far
    [[nodiscard]] std::size_t update_count() const noexcept { return m_update_count; }
    [[nodiscard]] const std::optional<SizeProposal>& last_proposal() const noexcept { return m_last_proposal; }

private:
    [[nodiscard]] Environment make_root_environment();
    LayoutResult run_update(const AnyView* new_root, const SizeProposal& proposal, bool dry_run);
    void handle_state_change();
    void handle_root_environment_change();

    IBackend& m_backend;
    EngineConfig m_config;
    /// Expires with the graph; queued main-thread tasks check it before running
    std::shared_ptr<bool> m_alive;
    SubscriptionId m_environment_subscription;
    Environment m_environment;
    std::unique_ptr<GraphNode> m_root;
    std::optional<SizeProposal> m_last_proposal;
    std::size_t m_update_count = 0;
    bool m_updating = false;
};

} // namespace loom_ui
