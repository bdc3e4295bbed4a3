#pragma once

/// @file stack.hpp
/// @brief Stack containers

#include <loom/ui/view.hpp>

#include <optional>
#include <vector>

namespace loom_ui {

// =============================================================================
// StackView
// =============================================================================

/// Children laid out one after another along an axis. A stack's kind includes
/// its child count, so a stack that gains or loses a child is rebuilt.
class StackView : public View {
public:
    [[nodiscard]] ViewKind kind() const override { return ViewKind{typeid(*this), m_children.size()}; }

    [[nodiscard]] const std::vector<AnyView>& content() const noexcept { return m_children; }
    [[nodiscard]] Orientation orientation() const noexcept { return m_orientation; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] std::vector<LayoutableChild> layoutable_children(
        IBackend& backend, ChildrenStorage& children) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

protected:
    StackView(Orientation orientation, std::vector<AnyView> children,
              StackAlignment alignment, std::optional<int> spacing);

private:
    [[nodiscard]] int resolved_spacing(const Environment& environment) const;
    [[nodiscard]] Environment child_environment(const Environment& environment) const;

    Orientation m_orientation;
    std::vector<AnyView> m_children;
    StackAlignment m_alignment;
    std::optional<int> m_spacing;
};

/// Top-to-bottom stack
class VStack : public StackView {
public:
    explicit VStack(std::vector<AnyView> children, StackAlignment alignment = StackAlignment::Center,
                    std::optional<int> spacing = std::nullopt)
        : StackView(Orientation::Vertical, std::move(children), alignment, spacing) {}

    [[nodiscard]] std::string name() const override { return "VStack"; }
};

/// Leading-to-trailing stack
class HStack : public StackView {
public:
    explicit HStack(std::vector<AnyView> children, StackAlignment alignment = StackAlignment::Center,
                    std::optional<int> spacing = std::nullopt)
        : StackView(Orientation::Horizontal, std::move(children), alignment, spacing) {}

    [[nodiscard]] std::string name() const override { return "HStack"; }
};

// =============================================================================
// ZStack
// =============================================================================

/// Children overlaid on each other, sized to the largest
class ZStack : public View {
public:
    explicit ZStack(std::vector<AnyView> children, Alignment alignment = Alignment::center())
        : m_children(std::move(children)), m_alignment(alignment) {}

    [[nodiscard]] ViewKind kind() const override { return ViewKind{typeid(ZStack), m_children.size()}; }
    [[nodiscard]] std::string name() const override { return "ZStack"; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] std::vector<LayoutableChild> layoutable_children(
        IBackend& backend, ChildrenStorage& children) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    std::vector<AnyView> m_children;
    Alignment m_alignment;
};

} // namespace loom_ui
