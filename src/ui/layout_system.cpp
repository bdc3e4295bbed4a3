/// @file layout_system.cpp
/// @brief Stack and overlay layout algorithms

#include <loom/ui/layout_system.hpp>

#include <loom/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace loom_ui {

namespace {

/// Lengths of `size` along and across `orientation`
struct AxisLengths {
    int major = 0;
    int cross = 0;
};

AxisLengths split(Size size, Orientation orientation) {
    if (orientation == Orientation::Horizontal) {
        return {size.width, size.height};
    }
    return {size.height, size.width};
}

Size join(int major, int cross, Orientation orientation) {
    if (orientation == Orientation::Horizontal) {
        return {major, cross};
    }
    return {cross, major};
}

Point join_point(int major, int cross, Orientation orientation) {
    if (orientation == Orientation::Horizontal) {
        return {major, cross};
    }
    return {cross, major};
}

std::size_t participating_count(const std::vector<LayoutResult>& results) {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const LayoutResult& r) { return r.participates_in_stack_layouts; }));
}

} // anonymous namespace

// =============================================================================
// Flex distribution
// =============================================================================

std::vector<int> LayoutSystem::distribute(const std::vector<FlexItem>& items, int available) {
    std::vector<int> allocation;
    allocation.reserve(items.size());
    int total_ideal = 0;
    for (const auto& item : items) {
        allocation.push_back(item.ideal);
        total_ideal += item.ideal;
    }

    available = std::max(available, 0);
    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    if (available >= total_ideal) {
        int remaining = available - total_ideal;

        std::vector<std::size_t> bounded;
        std::vector<std::size_t> unbounded;
        for (auto i : order) {
            (items[i].maximum ? bounded : unbounded).push_back(i);
        }

        std::stable_sort(bounded.begin(), bounded.end(), [&](std::size_t a, std::size_t b) {
            return (*items[a].maximum - items[a].ideal) < (*items[b].maximum - items[b].ideal);
        });

        for (auto i : bounded) {
            if (remaining == 0) {
                break;
            }
            int slack = std::max(*items[i].maximum - items[i].ideal, 0);
            int grant = std::min(slack, remaining);
            allocation[i] += grant;
            remaining -= grant;
        }

        if (!unbounded.empty() && remaining > 0) {
            int count = static_cast<int>(unbounded.size());
            int share = remaining / count;
            int extra = remaining % count;
            for (auto i : unbounded) {
                allocation[i] += share;
                if (extra > 0) {
                    allocation[i] += 1;
                    --extra;
                }
            }
        }
        return allocation;
    }

    int deficit = total_ideal - available;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return (items[a].ideal - items[a].minimum) < (items[b].ideal - items[b].minimum);
    });

    int children_remaining = static_cast<int>(order.size());
    for (auto i : order) {
        if (deficit <= 0) {
            break;
        }
        int slack = std::max(items[i].ideal - items[i].minimum, 0);
        int share = (deficit + children_remaining - 1) / children_remaining;
        int give = std::min(slack, share);
        allocation[i] -= give;
        deficit -= give;
        --children_remaining;
    }
    return allocation;
}

// =============================================================================
// Stacks
// =============================================================================

LayoutResult LayoutSystem::compute_stack_layout(
    const std::vector<LayoutableChild>& children, const SizeProposal& proposal,
    const Environment& environment, Orientation orientation, int spacing) {
    const Orientation cross_axis = perpendicular(orientation);
    const std::optional<int> major_proposal = proposal.length(orientation);
    const std::optional<int> cross_proposal = proposal.length(cross_axis);

    // Probe: ideal along the major axis
    std::vector<LayoutResult> probes;
    probes.reserve(children.size());
    for (const auto& child : children) {
        probes.push_back(child.compute_layout(
            SizeProposal::along(orientation, std::nullopt, cross_proposal), environment));
    }

    const std::size_t participating = participating_count(probes);
    const int total_spacing = participating > 1 ? spacing * static_cast<int>(participating - 1) : 0;

    std::vector<LayoutResult> results;
    if (!major_proposal) {
        results = probes;
    } else {
        std::vector<FlexItem> items;
        items.reserve(probes.size());
        for (const auto& probe : probes) {
            items.push_back(FlexItem{
                probe.size.length(orientation),
                probe.size.minimum(orientation),
                probe.size.maximum(orientation),
            });
        }

        auto allocation = distribute(items, *major_proposal - total_spacing);
        results.reserve(children.size());
        for (std::size_t i = 0; i < children.size(); ++i) {
            results.push_back(children[i].compute_layout(
                SizeProposal::along(orientation, allocation[i], cross_proposal), environment));
        }
    }

    int major = total_spacing;
    int cross = 0;
    int ideal_major = total_spacing;
    int ideal_cross = 0;
    int probe_major = total_spacing;
    int minimum_major = total_spacing;
    int minimum_cross = 0;
    std::optional<int> maximum_major = total_spacing;
    std::optional<int> maximum_cross = 0;

    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& size = results[i].size;
        const auto lengths = split(size.size, orientation);
        const auto ideal = split(size.ideal_size, orientation);

        major += lengths.major;
        cross = std::max(cross, lengths.cross);
        ideal_major += ideal.major;
        ideal_cross = std::max(ideal_cross, ideal.cross);
        probe_major += probes[i].size.length(orientation);
        minimum_major += size.minimum(orientation);
        minimum_cross = std::max(minimum_cross, size.minimum(cross_axis));

        auto child_max_major = size.maximum(orientation);
        auto child_max_cross = size.maximum(cross_axis);
        maximum_major = (maximum_major && child_max_major)
            ? std::optional<int>(*maximum_major + *child_max_major) : std::nullopt;
        maximum_cross = (maximum_cross && child_max_cross)
            ? std::optional<int>(std::max(*maximum_cross, *child_max_cross)) : std::nullopt;
    }

    const Size ideal_size = join(ideal_major, ideal_cross, orientation);
    const bool horizontal = orientation == Orientation::Horizontal;

    loom_core::layout_logger()->trace("Stack of {} children: {}x{}", children.size(),
                           join(major, cross, orientation).width, join(major, cross, orientation).height);

    return LayoutResult{
        ViewSize(
            join(major, cross, orientation),
            ideal_size,
            horizontal ? probe_major : cross,
            horizontal ? cross : probe_major,
            horizontal ? minimum_major : minimum_cross,
            horizontal ? minimum_cross : minimum_major,
            horizontal ? maximum_major : maximum_cross,
            horizontal ? maximum_cross : maximum_major),
        std::move(results),
        true,
    };
}

void LayoutSystem::commit_stack_layout(
    WidgetHandle container, const std::vector<LayoutableChild>& children, const LayoutResult& layout,
    Orientation orientation, StackAlignment alignment, int spacing, IBackend& backend) {
    const auto allotted = split(layout.size.size, orientation);
    const double factor = alignment_factor(alignment);

    int offset = 0;
    bool placed_any = false;
    for (std::size_t i = 0; i < children.size() && i < layout.child_results.size(); ++i) {
        children[i].commit();

        const auto& result = layout.child_results[i];
        const auto child = split(result.size.size, orientation);
        if (result.participates_in_stack_layouts && placed_any) {
            offset += spacing;
        }

        int cross_offset = static_cast<int>(std::lround((allotted.cross - child.cross) * factor));
        backend.set_position(container, i, join_point(offset, cross_offset, orientation));

        if (result.participates_in_stack_layouts) {
            offset += child.major;
            placed_any = true;
        }
    }

    backend.set_size(container, layout.size.size);
}

// =============================================================================
// Overlays
// =============================================================================

LayoutResult LayoutSystem::compute_overlay_layout(
    const std::vector<LayoutableChild>& children, const SizeProposal& proposal,
    const Environment& environment) {
    std::vector<LayoutResult> results;
    results.reserve(children.size());

    Size size;
    Size ideal;
    int ideal_width_for_height = 0;
    int ideal_height_for_width = 0;
    int minimum_width = 0;
    int minimum_height = 0;
    std::optional<int> maximum_width = 0;
    std::optional<int> maximum_height = 0;

    for (const auto& child : children) {
        auto result = child.compute_layout(proposal, environment);
        const auto& s = result.size;

        size.width = std::max(size.width, s.size.width);
        size.height = std::max(size.height, s.size.height);
        ideal.width = std::max(ideal.width, s.ideal_size.width);
        ideal.height = std::max(ideal.height, s.ideal_size.height);
        ideal_width_for_height = std::max(ideal_width_for_height, s.ideal_width_for_proposed_height);
        ideal_height_for_width = std::max(ideal_height_for_width, s.ideal_height_for_proposed_width);
        minimum_width = std::max(minimum_width, s.minimum_width);
        minimum_height = std::max(minimum_height, s.minimum_height);
        maximum_width = (maximum_width && s.maximum_width)
            ? std::optional<int>(std::max(*maximum_width, *s.maximum_width)) : std::nullopt;
        maximum_height = (maximum_height && s.maximum_height)
            ? std::optional<int>(std::max(*maximum_height, *s.maximum_height)) : std::nullopt;

        results.push_back(std::move(result));
    }

    return LayoutResult{
        ViewSize(size, ideal, ideal_width_for_height, ideal_height_for_width,
                 minimum_width, minimum_height, maximum_width, maximum_height),
        std::move(results),
        true,
    };
}

void LayoutSystem::commit_overlay_layout(
    WidgetHandle container, const std::vector<LayoutableChild>& children, const LayoutResult& layout,
    Alignment alignment, IBackend& backend) {
    for (std::size_t i = 0; i < children.size() && i < layout.child_results.size(); ++i) {
        children[i].commit();
        backend.set_position(container, i, alignment.position(layout.size.size, layout.child_results[i].size.size));
    }
    backend.set_size(container, layout.size.size);
}

Environment LayoutSystem::stack_environment(
    const Environment& environment, Orientation orientation, StackAlignment alignment, int spacing) {
    return environment
        .with(&EnvironmentValues::layout_orientation, orientation)
        .with(&EnvironmentValues::layout_alignment, alignment)
        .with(&EnvironmentValues::layout_spacing, spacing);
}

} // namespace loom_ui
