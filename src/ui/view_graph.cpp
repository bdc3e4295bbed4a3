/// @file view_graph.cpp
/// @brief ViewGraph implementation

#include <loom/ui/view_graph.hpp>
#include <loom/ui/children.hpp>

#include <loom/core/log.hpp>

namespace loom_ui {

namespace {

/// Clears the in-progress flag however the update exits
class UpdateGuard {
public:
    explicit UpdateGuard(bool& flag) : m_flag(flag) { m_flag = true; }
    ~UpdateGuard() { m_flag = false; }

    UpdateGuard(const UpdateGuard&) = delete;
    UpdateGuard& operator=(const UpdateGuard&) = delete;

private:
    bool& m_flag;
};

} // anonymous namespace

ViewGraph::ViewGraph(AnyView root, IBackend& backend, const EngineConfig& config, const NodeSnapshot* snapshot)
    : m_backend(backend)
    , m_config(config)
    , m_alive(std::make_shared<bool>(true)) {
    m_environment = make_root_environment();

    if (snapshot && snapshot->name != root.name()) {
        loom_core::Error error = loom_core::GraphError::snapshot_mismatch(root.name(), snapshot->name);
        loom_core::debug::record_error(error);
        loom_core::graph_logger()->warn("Ignoring snapshot: {}", loom_core::build_error_chain(error));
        snapshot = nullptr;
    }

    m_root = std::make_unique<GraphNode>(std::move(root), backend, m_environment, snapshot);

    std::weak_ptr<bool> alive = m_alive;
    m_environment_subscription = m_backend.subscribe_root_environment_change([this, alive]() {
        if (alive.lock()) {
            handle_root_environment_change();
        }
    });

    loom_core::graph_logger()->info("View graph created for {} on {} backend",
                                    m_root->view().name(), m_backend.name());
}

ViewGraph::~ViewGraph() {
    m_alive.reset();
    if (!m_backend.unsubscribe_root_environment_change(m_environment_subscription)) {
        loom_core::graph_logger()->warn("Root environment subscription of {} was already removed",
                                        m_root->view().name());
    }
    m_root->teardown();
}

Environment ViewGraph::make_root_environment() {
    std::weak_ptr<bool> alive = m_alive;
    return m_backend.compute_root_environment(m_config.default_environment())
        .with(&EnvironmentValues::backend, &m_backend)
        .with(&EnvironmentValues::on_state_change, std::function<void()>([this, alive]() {
            m_backend.run_in_main_thread([this, alive]() {
                if (alive.lock()) {
                    handle_state_change();
                }
            });
        }))
        .scoped();
}

LayoutResult ViewGraph::update(const SizeProposal& proposal, bool dry_run) {
    return run_update(nullptr, proposal, dry_run);
}

LayoutResult ViewGraph::update(AnyView new_root, const SizeProposal& proposal, bool dry_run) {
    return run_update(&new_root, proposal, dry_run);
}

LayoutResult ViewGraph::run_update(const AnyView* new_root, const SizeProposal& proposal, bool dry_run) {
    if (m_updating) {
        loom_core::contract_violation("ViewGraph::update called while an update is in progress");
    }
    UpdateGuard guard(m_updating);
    LOOM_LOG_SCOPE("ViewGraph::update", "loom.graph");

    if (new_root && !m_root->can_update_with(*new_root)) {
        loom_core::graph_logger()->debug("Replacing root {} with {}", m_root->view().name(), new_root->name());
        m_root->teardown();
        m_root = std::make_unique<GraphNode>(*new_root, m_backend, m_environment);
        new_root = nullptr;
    }

    auto result = m_root->compute_layout(new_root, proposal, m_environment);
    if (dry_run) {
        return result;
    }

    m_root->commit();
    m_last_proposal = proposal;
    ++m_update_count;
    return result;
}

NodeSnapshot ViewGraph::snapshot() const {
    return m_root->snapshot();
}

void ViewGraph::handle_state_change() {
    loom_core::graph_logger()->debug("State changed, updating {}", m_root->view().name());
    update(m_last_proposal.value_or(SizeProposal::ideal()));
}

void ViewGraph::handle_root_environment_change() {
    loom_core::graph_logger()->debug("Root environment changed");
    m_environment = make_root_environment();
    update(m_last_proposal.value_or(SizeProposal::ideal()));
}

} // namespace loom_ui
