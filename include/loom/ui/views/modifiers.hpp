#pragma once

/// @file modifiers.hpp
/// @brief Single-child views that adjust layout, lifetime or environment
///
/// Modifiers are normally applied through `AnyView`:
///
/// @code
/// AnyView row = Text("Name")
///     .padding(8)
///     .frame(FlexibleFrameOptions{.max_width = k_unbounded})
///     .foreground_color(Color::gray());
/// @endcode

#include <loom/ui/view.hpp>

#include <functional>
#include <limits>
#include <optional>

namespace loom_ui {

/// Maximum length meaning "as large as proposed"
inline constexpr int k_unbounded = std::numeric_limits<int>::max();

struct FlexibleFrameOptions {
    std::optional<int> min_width;
    std::optional<int> ideal_width;
    std::optional<int> max_width;
    std::optional<int> min_height;
    std::optional<int> ideal_height;
    std::optional<int> max_height;
    Alignment alignment = Alignment::center();
};

// =============================================================================
// ModifierView
// =============================================================================

/// Base for views wrapping exactly one child in a container widget
class ModifierView : public View {
public:
    [[nodiscard]] const AnyView& child() const noexcept { return m_child; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] std::vector<LayoutableChild> layoutable_children(
        IBackend& backend, ChildrenStorage& children) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

protected:
    explicit ModifierView(AnyView child) : m_child(std::move(child)) {}

    /// Update and lay out the child
    LayoutResult layout_child(ChildrenStorage& children, const SizeProposal& proposal,
                              const Environment& environment) const;

    /// Commit the child, place it at `position` and size the container
    void commit_child(WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
                      Point position, IBackend& backend) const;

private:
    AnyView m_child;
};

// =============================================================================
// Layout modifiers
// =============================================================================

class PaddingModifier : public ModifierView {
public:
    PaddingModifier(AnyView child, EdgeInsets insets) : ModifierView(std::move(child)), m_insets(insets) {}

    [[nodiscard]] std::string name() const override { return "Padding"; }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    EdgeInsets m_insets;
};

/// Strict frame: each given axis has exactly the given length
class FrameModifier : public ModifierView {
public:
    FrameModifier(AnyView child, std::optional<int> width, std::optional<int> height, Alignment alignment)
        : ModifierView(std::move(child)), m_width(width), m_height(height), m_alignment(alignment) {}

    [[nodiscard]] std::string name() const override { return "Frame"; }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    std::optional<int> m_width;
    std::optional<int> m_height;
    Alignment m_alignment;
};

/// Flexible frame: each axis is clamped into `[min, max]`
class FlexibleFrameModifier : public ModifierView {
public:
    FlexibleFrameModifier(AnyView child, FlexibleFrameOptions options)
        : ModifierView(std::move(child)), m_options(options) {}

    [[nodiscard]] std::string name() const override { return "FlexibleFrame"; }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    FlexibleFrameOptions m_options;
};

/// Lays the child out at its ideal length on the frozen axes
class FixedSizeModifier : public ModifierView {
public:
    FixedSizeModifier(AnyView child, bool horizontal, bool vertical)
        : ModifierView(std::move(child)), m_horizontal(horizontal), m_vertical(vertical) {}

    [[nodiscard]] std::string name() const override { return "FixedSize"; }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    bool m_horizontal;
    bool m_vertical;
};

// =============================================================================
// Lifecycle & environment modifiers
// =============================================================================

/// Runs an action when its node is torn down, before the child's teardown
class OnDisappearModifier : public ModifierView {
public:
    OnDisappearModifier(AnyView child, std::function<void()> action)
        : ModifierView(std::move(child)), m_action(std::move(action)) {}

    [[nodiscard]] std::string name() const override { return "OnDisappear"; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    std::function<void()> m_action;
};

/// Overrides environment values for its subtree
class EnvironmentModifier : public ModifierView {
public:
    using Transform = std::function<Environment(const Environment&)>;

    EnvironmentModifier(AnyView child, Transform transform)
        : ModifierView(std::move(child)), m_transform(std::move(transform)) {}

    [[nodiscard]] std::string name() const override { return "EnvironmentModifier"; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    [[nodiscard]] Environment child_environment(const Environment& environment) const;

    Transform m_transform;
};

} // namespace loom_ui
