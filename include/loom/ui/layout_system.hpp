#pragma once

/// @file layout_system.hpp
/// @brief Shared layout algorithms for container views
///
/// Stacks lay children out in two passes. The probe pass proposes every child
/// its ideal major-axis length (with the full cross-axis proposal) to collect
/// ideal, minimum and maximum lengths. `distribute` then splits the available
/// major length and the final pass re-proposes each child its allocation.

#include "backend.hpp"
#include "environment.hpp"
#include "view.hpp"
#include "view_size.hpp"

#include <optional>
#include <vector>

namespace loom_ui {

/// Major-axis flexibility of one stack child
struct FlexItem {
    int ideal = 0;
    int minimum = 0;
    /// Missing means the child grows without bound
    std::optional<int> maximum;
};

class LayoutSystem {
public:
    /// Split `available` among `items`.
    ///
    /// Growth: bounded items are granted extra space least-slack-first (slack =
    /// maximum - ideal, ties by position) up to their maximum; what remains is
    /// split evenly among unbounded items, remainder pixels to the earliest.
    ///
    /// Shrink: items give up space least-shrinkable-first (ideal - minimum),
    /// each taking at most an even share of the remaining deficit. Items never
    /// go below their minimum, so the result may exceed `available`.
    [[nodiscard]] static std::vector<int> distribute(const std::vector<FlexItem>& items, int available);

    /// Lay out `children` as a stack along `orientation`
    [[nodiscard]] static LayoutResult compute_stack_layout(
        const std::vector<LayoutableChild>& children, const SizeProposal& proposal,
        const Environment& environment, Orientation orientation, int spacing);

    /// Commit children laid out by `compute_stack_layout` and position them
    static void commit_stack_layout(
        WidgetHandle container, const std::vector<LayoutableChild>& children, const LayoutResult& layout,
        Orientation orientation, StackAlignment alignment, int spacing, IBackend& backend);

    /// Lay out `children` on top of each other, sized to the largest
    [[nodiscard]] static LayoutResult compute_overlay_layout(
        const std::vector<LayoutableChild>& children, const SizeProposal& proposal,
        const Environment& environment);

    static void commit_overlay_layout(
        WidgetHandle container, const std::vector<LayoutableChild>& children, const LayoutResult& layout,
        Alignment alignment, IBackend& backend);

    /// Environment a stack passes to its children
    [[nodiscard]] static Environment stack_environment(
        const Environment& environment, Orientation orientation, StackAlignment alignment, int spacing);
};

} // namespace loom_ui
