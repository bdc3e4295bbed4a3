#pragma once

/// @file scroll_view.hpp
/// @brief Scrollable viewport around a vertical stack

#include <loom/ui/view.hpp>

#include <vector>

namespace loom_ui {

/// Scrolls its content along the enabled axes.
///
/// Layout runs in two passes. The first lays the content out at its ideal
/// length on the scroll axes to find which axes overflow the viewport; those
/// axes get a scroll bar. The second pass proposes the viewport shrunk by the
/// scroll bars (or the content's ideal length on overflowing axes). The
/// overflow flags are kept in the node for commit.
class ScrollView : public View {
public:
    explicit ScrollView(std::vector<AnyView> content, Axes axes = Axes::vertical_only());

    [[nodiscard]] std::string name() const override { return "ScrollView"; }
    [[nodiscard]] Axes axes() const noexcept { return m_axes; }

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
    AnyView m_body;
    Axes m_axes;
};

/// Overflow state of a scroll view's last layout
struct ScrollBarState {
    bool vertical = false;
    bool horizontal = false;
};

/// Scroll bars a scroll view node decided on in its last layout
[[nodiscard]] ScrollBarState scroll_bar_state(ChildrenStorage& children);

} // namespace loom_ui
