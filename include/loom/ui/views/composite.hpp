#pragma once

/// @file composite.hpp
/// @brief User-defined views built from a body and node-local state
///
/// @code
/// class Counter : public CompositeView {
/// public:
///     std::string name() const override { return "Counter"; }
///
///     AnyView body(ViewContext& context) const override {
///         auto count = context.state<int>("count", 0);
///         return VStack({
///             Text("Count: " + std::to_string(count.get())),
///             Button("Increment", [count]() { count.set(count.get() + 1); }),
///         });
///     }
/// };
/// @endcode
///
/// State lives in the graph node, not in the view value, so it survives
/// every rebuild of the parent. Writing a state binding asks the owning
/// `ViewGraph` for an update through the environment.

#include <loom/ui/binding.hpp>
#include <loom/ui/view.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace loom_ui {

// =============================================================================
// ViewContext
// =============================================================================

/// Access to a composite node's state while its body is being built
class ViewContext {
public:
    ViewContext(std::shared_ptr<nlohmann::json> state, Environment environment)
        : m_state(std::move(state)), m_environment(std::move(environment)) {}

    /// Binding to the state entry `key`, created with `initial` on first use.
    /// `T` must be convertible to and from JSON.
    template<typename T>
    [[nodiscard]] Binding<T> state(const std::string& key, T initial) {
        if (!m_state->contains(key)) {
            (*m_state)[key] = std::move(initial);
        }

        auto state = m_state;
        auto environment = m_environment;
        return Binding<T>(
            [state, key]() { return state->at(key).template get<T>(); },
            [state, key, environment](const T& value) {
                (*state)[key] = value;
                environment.notify_state_change();
            });
    }

    [[nodiscard]] const Environment& environment() const noexcept { return m_environment; }

private:
    std::shared_ptr<nlohmann::json> m_state;
    Environment m_environment;
};

// =============================================================================
// CompositeView
// =============================================================================

class CompositeView : public View {
public:
    /// State of a node that was not restored from a snapshot
    [[nodiscard]] virtual nlohmann::json initial_state() const { return nlohmann::json::object(); }

    /// Content of this view for the current state
    [[nodiscard]] virtual AnyView body(ViewContext& context) const = 0;

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const final;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const final;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const final;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const final;
};

} // namespace loom_ui
