#pragma once

/// @file conditional.hpp
/// @brief Empty and conditional views

#include <loom/ui/view.hpp>

#include <optional>

namespace loom_ui {

/// Displays nothing and takes no stack spacing
class EmptyView : public ElementaryView {
public:
    [[nodiscard]] std::string name() const override { return "EmptyView"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;
};

/// One of two views chosen by a condition.
///
/// Switching branch always tears down the displayed subtree and builds the
/// other one. The state of the subtree being dropped is kept in the node and
/// restored when its branch is shown again.
class EitherView : public View {
public:
    EitherView(bool condition, AnyView if_true, AnyView if_false)
        : m_condition(condition), m_if_true(std::move(if_true)), m_if_false(std::move(if_false)) {}

    [[nodiscard]] std::string name() const override { return "EitherView"; }

    [[nodiscard]] bool condition() const noexcept { return m_condition; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    [[nodiscard]] const AnyView& active() const noexcept { return m_condition ? m_if_true : m_if_false; }

    bool m_condition;
    AnyView m_if_true;
    AnyView m_if_false;
};

/// A view shown only when present
class OptionalView : public EitherView {
public:
    explicit OptionalView(std::optional<AnyView> content);

    [[nodiscard]] std::string name() const override { return "OptionalView"; }
};

} // namespace loom_ui
