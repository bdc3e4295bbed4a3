#pragma once

/// @file view_size.hpp
/// @brief Size negotiation types: proposals in, view sizes out

#include "types.hpp"

#include <optional>
#include <vector>

namespace loom_ui {

// =============================================================================
// SizeProposal
// =============================================================================

/// A proposed view size. A missing axis asks the view for its ideal length
/// along that axis (given the other axis, when present).
struct SizeProposal {
    std::optional<int> width;
    std::optional<int> height;

    constexpr SizeProposal() = default;
    constexpr SizeProposal(std::optional<int> w, std::optional<int> h) : width(w), height(h) {}
    constexpr explicit SizeProposal(Size size) : width(size.width), height(size.height) {}

    /// Both axes left to the view
    static constexpr SizeProposal ideal() { return {std::nullopt, std::nullopt}; }
    /// An empty proposal
    static constexpr SizeProposal zero() { return {0, 0}; }

    /// Build a proposal from major/cross lengths along an orientation
    static constexpr SizeProposal along(Orientation orientation, std::optional<int> major, std::optional<int> cross) {
        return orientation == Orientation::Horizontal ? SizeProposal{major, cross} : SizeProposal{cross, major};
    }

    /// The proposal as a concrete size if both axes are set
    [[nodiscard]] constexpr std::optional<Size> concrete() const {
        if (!width || !height) {
            return std::nullopt;
        }
        return Size{*width, *height};
    }

    /// Fill missing axes from a view's ideal size
    [[nodiscard]] constexpr Size evaluated(Size ideal_size) const {
        return Size{width.value_or(ideal_size.width), height.value_or(ideal_size.height)};
    }

    [[nodiscard]] constexpr std::optional<int> length(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? width : height;
    }

    constexpr bool operator==(const SizeProposal&) const = default;
};

// =============================================================================
// ViewSize
// =============================================================================

/// A view's response to a proposal. A missing maximum means unbounded.
struct ViewSize {
    Size size;
    Size ideal_size;
    /// Ideal width once the proposed height is fixed (wrapping content)
    int ideal_width_for_proposed_height = 0;
    /// Ideal height once the proposed width is fixed (wrapping content)
    int ideal_height_for_proposed_width = 0;
    int minimum_width = 0;
    int minimum_height = 0;
    std::optional<int> maximum_width;
    std::optional<int> maximum_height;

    ViewSize() = default;

    ViewSize(Size size_, Size ideal, int ideal_width_for_height, int ideal_height_for_width,
             int min_width, int min_height,
             std::optional<int> max_width, std::optional<int> max_height)
        : size(size_)
        , ideal_size(ideal)
        , ideal_width_for_proposed_height(ideal_width_for_height)
        , ideal_height_for_proposed_width(ideal_height_for_width)
        , minimum_width(min_width)
        , minimum_height(min_height)
        , maximum_width(max_width)
        , maximum_height(max_height) {}

    /// Size reporting with ideal-for-proposed hints taken from the ideal size
    ViewSize(Size size_, Size ideal, int min_width, int min_height,
             std::optional<int> max_width, std::optional<int> max_height)
        : ViewSize(size_, ideal, ideal.width, ideal.height, min_width, min_height, max_width, max_height) {}

    /// A view that is exactly `size` whatever it is proposed
    [[nodiscard]] static ViewSize fixed(Size size) {
        return ViewSize(size, size, size.width, size.height, size.width, size.height, size.width, size.height);
    }

    /// Zero along every dimension, including maxima
    [[nodiscard]] static ViewSize empty() { return fixed(Size::zero()); }

    [[nodiscard]] int length(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? size.width : size.height;
    }

    [[nodiscard]] int ideal_length(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? ideal_size.width : ideal_size.height;
    }

    [[nodiscard]] int minimum(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? minimum_width : minimum_height;
    }

    [[nodiscard]] std::optional<int> maximum(Orientation orientation) const {
        return orientation == Orientation::Horizontal ? maximum_width : maximum_height;
    }

    bool operator==(const ViewSize&) const = default;
};

// =============================================================================
// LayoutResult
// =============================================================================

/// Result of a layout pass for one view, including its children's final results
struct LayoutResult {
    ViewSize size;
    std::vector<LayoutResult> child_results;
    /// Stacks skip spacing around views that opt out (empty views)
    bool participates_in_stack_layouts = true;

    [[nodiscard]] static LayoutResult leaf_view(const ViewSize& size) {
        return LayoutResult{size, {}, true};
    }

    bool operator==(const LayoutResult&) const = default;
};

} // namespace loom_ui
