#pragma once

/// @file view.hpp
/// @brief The view protocol and its type-erased handle
///
/// A view is an immutable description of content. The graph node owning a
/// view drives it through four calls:
///
/// 1. `children()` once, to build the node's children storage
/// 2. `as_widget()` once, to create the node's native widget
/// 3. `compute_layout()` any number of times (dry runs included)
/// 4. `commit()` at most once per real update, after the final layout
///
/// Views never hold widget handles; anything that must persist between
/// updates lives in the children storage.

#include "backend.hpp"
#include "environment.hpp"
#include "view_size.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace loom_ui {

struct NodeSnapshot;
struct FlexibleFrameOptions;
class ChildrenStorage;

// =============================================================================
// ViewKind
// =============================================================================

/// Identity used to decide whether a node can be updated in place.
/// Fixed-arity containers include their child count.
struct ViewKind {
    std::type_index type;
    std::size_t arity = 0;

    bool operator==(const ViewKind&) const = default;
};

// =============================================================================
// LayoutableChild
// =============================================================================

/// A child exposed to the shared layout algorithms
struct LayoutableChild {
    std::function<LayoutResult(const SizeProposal&, const Environment&)> compute_layout;
    std::function<void()> commit;
};

// =============================================================================
// View
// =============================================================================

class View {
public:
    virtual ~View() = default;

    [[nodiscard]] virtual ViewKind kind() const { return ViewKind{typeid(*this), 0}; }

    /// Stable name used to match snapshots against views
    [[nodiscard]] virtual std::string name() const { return typeid(*this).name(); }

    /// Build (or restore from `snapshot`) the children storage for this kind
    [[nodiscard]] virtual std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const = 0;

    /// Children participating in the generic layout algorithms
    [[nodiscard]] virtual std::vector<LayoutableChild> layoutable_children(
        IBackend& /*backend*/, ChildrenStorage& /*children*/) const {
        return {};
    }

    /// Create the native widget; called once per node
    [[nodiscard]] virtual WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const = 0;

    /// Compute sizes without assigning final geometry
    [[nodiscard]] virtual LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const = 0;

    /// Apply the last computed layout to the native widgets
    virtual void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const = 0;
};

template<typename V>
concept ViewType = std::derived_from<std::decay_t<V>, View>;

// =============================================================================
// AnyView
// =============================================================================

/// Shared, immutable handle to any view
class AnyView {
public:
    template<ViewType V>
    AnyView(V view)
        : m_view(std::make_shared<const std::decay_t<V>>(std::move(view))) {}

    explicit AnyView(std::shared_ptr<const View> view);

    [[nodiscard]] const View& operator*() const noexcept { return *m_view; }
    [[nodiscard]] const View* operator->() const noexcept { return m_view.get(); }
    [[nodiscard]] const View& get() const noexcept { return *m_view; }

    [[nodiscard]] ViewKind kind() const { return m_view->kind(); }
    [[nodiscard]] std::string name() const { return m_view->name(); }

    /// Downcast to a concrete view type
    template<ViewType V>
    [[nodiscard]] const V* as() const {
        return dynamic_cast<const V*>(m_view.get());
    }

    // -------------------------------------------------------------------------
    // Modifiers (implemented in views/modifiers.cpp)
    // -------------------------------------------------------------------------

    [[nodiscard]] AnyView padding(int amount) const;
    [[nodiscard]] AnyView padding(EdgeInsets insets) const;
    [[nodiscard]] AnyView frame(std::optional<int> width, std::optional<int> height,
                                Alignment alignment = Alignment::center()) const;
    [[nodiscard]] AnyView frame(const FlexibleFrameOptions& options) const;
    [[nodiscard]] AnyView fixed_size(bool horizontal = true, bool vertical = true) const;
    [[nodiscard]] AnyView on_disappear(std::function<void()> action) const;
    [[nodiscard]] AnyView foreground_color(Color color) const;
    [[nodiscard]] AnyView font(Font font) const;
    [[nodiscard]] AnyView environment(std::function<Environment(const Environment&)> transform) const;

private:
    std::shared_ptr<const View> m_view;
};

// =============================================================================
// ElementaryView
// =============================================================================

/// Base for leaf views without children
class ElementaryView : public View {
public:
    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const final;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& /*children*/, IBackend& backend) const final {
        return create_widget(backend);
    }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& /*children*/, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const final {
        return layout_leaf(widget, proposal, environment, backend);
    }

    void commit(
        WidgetHandle widget, ChildrenStorage& /*children*/, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const final {
        commit_leaf(widget, layout, environment, backend);
    }

protected:
    [[nodiscard]] virtual WidgetHandle create_widget(IBackend& backend) const = 0;

    [[nodiscard]] virtual LayoutResult layout_leaf(
        WidgetHandle widget, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const = 0;

    virtual void commit_leaf(
        WidgetHandle widget, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const = 0;
};

} // namespace loom_ui
