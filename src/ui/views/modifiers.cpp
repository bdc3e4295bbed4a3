/// @file modifiers.cpp
/// @brief Layout, lifecycle and environment modifiers

#include <loom/ui/views/modifiers.hpp>

#include <loom/ui/children.hpp>

#include <algorithm>

namespace loom_ui {

namespace {

std::optional<int> inset(std::optional<int> length, int amount) {
    if (!length) {
        return std::nullopt;
    }
    return std::max(*length - amount, 0);
}

std::optional<int> outset(std::optional<int> length, int amount) {
    if (!length) {
        return std::nullopt;
    }
    return *length + amount;
}

LayoutResult pass_through(LayoutResult child) {
    auto size = child.size;
    const bool participates = child.participates_in_stack_layouts;
    return LayoutResult{size, {std::move(child)}, participates};
}

/// One axis of a flexible frame
struct FrameAxis {
    std::optional<int> minimum;
    std::optional<int> ideal;
    std::optional<int> maximum;

    [[nodiscard]] std::optional<int> bounded_maximum() const {
        if (!maximum || *maximum == k_unbounded) {
            return std::nullopt;
        }
        return maximum;
    }

    [[nodiscard]] int clamp(int length) const {
        if (auto hi = bounded_maximum()) {
            length = std::min(length, *hi);
        }
        if (minimum) {
            length = std::max(length, *minimum);
        }
        return length;
    }

    [[nodiscard]] std::optional<int> child_proposal(std::optional<int> proposed) const {
        auto target = proposed ? proposed : ideal;
        if (!target) {
            return std::nullopt;
        }
        return clamp(*target);
    }

    [[nodiscard]] int length(std::optional<int> proposed, int child) const {
        const int target = proposed.value_or(ideal.value_or(child));
        const int hi = maximum ? *maximum : std::max(child, minimum.value_or(child));
        const int lo = minimum ? *minimum : std::min(child, hi);
        return std::clamp(target, lo, std::max(lo, hi));
    }

    [[nodiscard]] int reported_minimum(int child) const {
        return minimum.value_or(child);
    }

    [[nodiscard]] std::optional<int> reported_maximum(std::optional<int> child) const {
        if (maximum) {
            return bounded_maximum();
        }
        if (child && minimum) {
            return std::max(*child, *minimum);
        }
        return child;
    }
};

// =============================================================================
// Disappear storage
// =============================================================================

class DisappearChildren : public TupleChildren {
public:
    DisappearChildren(const std::vector<AnyView>& views, IBackend& backend,
                      const NodeSnapshot* snapshot, const Environment& environment,
                      std::function<void()> action)
        : TupleChildren(views, backend, snapshot, environment), m_action(std::move(action)) {}

    void set_action(std::function<void()> action) { m_action = std::move(action); }

    void teardown() override {
        if (m_action) {
            auto action = std::move(m_action);
            m_action = nullptr;
            action();
        }
        TupleChildren::teardown();
    }

private:
    std::function<void()> m_action;
};

} // anonymous namespace

// =============================================================================
// ModifierView
// =============================================================================

std::unique_ptr<ChildrenStorage> ModifierView::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<TupleChildren>(std::vector<AnyView>{m_child}, backend, snapshot, environment);
}

std::vector<LayoutableChild> ModifierView::layoutable_children(IBackend& /*backend*/, ChildrenStorage& children) const {
    return storage_cast<TupleChildren>(children).layoutable({m_child});
}

WidgetHandle ModifierView::as_widget(ChildrenStorage& children, IBackend& backend) const {
    const auto container = backend.create_container();
    backend.add_child(storage_cast<TupleChildren>(children).node(0).widget(), container);
    return container;
}

LayoutResult ModifierView::layout_child(ChildrenStorage& children, const SizeProposal& proposal,
                                        const Environment& environment) const {
    return storage_cast<TupleChildren>(children).update_child(0, m_child, proposal, environment);
}

void ModifierView::commit_child(WidgetHandle widget, ChildrenStorage& children, const LayoutResult& /*layout*/,
                                Point position, IBackend& backend) const {
    auto& storage = storage_cast<TupleChildren>(children);
    sync_container_widgets(backend, widget, storage);
    storage.node(0).commit();
    backend.set_position(widget, 0, position);
}

// =============================================================================
// PaddingModifier
// =============================================================================

LayoutResult PaddingModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    const int h = m_insets.horizontal();
    const int v = m_insets.vertical();

    auto child = layout_child(children, SizeProposal{inset(proposal.width, h), inset(proposal.height, v)}, environment);
    const auto& s = child.size;

    ViewSize size(
        s.size + Size{h, v},
        s.ideal_size + Size{h, v},
        s.ideal_width_for_proposed_height + h,
        s.ideal_height_for_proposed_width + v,
        s.minimum_width + h,
        s.minimum_height + v,
        outset(s.maximum_width, h),
        outset(s.maximum_height, v));
    return LayoutResult{size, {std::move(child)}, true};
}

void PaddingModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    commit_child(widget, children, layout, Point{m_insets.leading, m_insets.top}, backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// FrameModifier
// =============================================================================

LayoutResult FrameModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    auto child = layout_child(
        children, SizeProposal{m_width ? m_width : proposal.width, m_height ? m_height : proposal.height},
        environment);
    const auto& s = child.size;

    ViewSize size(
        Size{m_width.value_or(s.size.width), m_height.value_or(s.size.height)},
        Size{m_width.value_or(s.ideal_size.width), m_height.value_or(s.ideal_size.height)},
        m_width.value_or(s.ideal_width_for_proposed_height),
        m_height.value_or(s.ideal_height_for_proposed_width),
        m_width.value_or(s.minimum_width),
        m_height.value_or(s.minimum_height),
        m_width ? m_width : s.maximum_width,
        m_height ? m_height : s.maximum_height);
    return LayoutResult{size, {std::move(child)}, true};
}

void FrameModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    const auto child_size = layout.child_results.front().size.size;
    commit_child(widget, children, layout, m_alignment.position(layout.size.size, child_size), backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// FlexibleFrameModifier
// =============================================================================

LayoutResult FlexibleFrameModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    const FrameAxis horizontal{m_options.min_width, m_options.ideal_width, m_options.max_width};
    const FrameAxis vertical{m_options.min_height, m_options.ideal_height, m_options.max_height};

    auto child = layout_child(
        children,
        SizeProposal{horizontal.child_proposal(proposal.width), vertical.child_proposal(proposal.height)},
        environment);
    const auto& s = child.size;

    const Size ideal{
        m_options.ideal_width.value_or(horizontal.clamp(s.ideal_size.width)),
        m_options.ideal_height.value_or(vertical.clamp(s.ideal_size.height)),
    };

    ViewSize size(
        Size{horizontal.length(proposal.width, s.size.width), vertical.length(proposal.height, s.size.height)},
        ideal,
        m_options.ideal_width.value_or(horizontal.clamp(s.ideal_width_for_proposed_height)),
        m_options.ideal_height.value_or(vertical.clamp(s.ideal_height_for_proposed_width)),
        horizontal.reported_minimum(s.minimum_width),
        vertical.reported_minimum(s.minimum_height),
        horizontal.reported_maximum(s.maximum_width),
        vertical.reported_maximum(s.maximum_height));
    return LayoutResult{size, {std::move(child)}, true};
}

void FlexibleFrameModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    const auto child_size = layout.child_results.front().size.size;
    commit_child(widget, children, layout, m_options.alignment.position(layout.size.size, child_size), backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// FixedSizeModifier
// =============================================================================

LayoutResult FixedSizeModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    auto child = layout_child(
        children,
        SizeProposal{m_horizontal ? std::nullopt : proposal.width, m_vertical ? std::nullopt : proposal.height},
        environment);
    const auto& s = child.size;

    ViewSize size(
        s.size,
        s.ideal_size,
        s.ideal_width_for_proposed_height,
        s.ideal_height_for_proposed_width,
        m_horizontal ? s.size.width : s.minimum_width,
        m_vertical ? s.size.height : s.minimum_height,
        m_horizontal ? std::optional<int>(s.size.width) : s.maximum_width,
        m_vertical ? std::optional<int>(s.size.height) : s.maximum_height);
    return LayoutResult{size, {std::move(child)}, true};
}

void FixedSizeModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    const auto child_size = layout.child_results.front().size.size;
    commit_child(widget, children, layout, Alignment::center().position(layout.size.size, child_size), backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// OnDisappearModifier
// =============================================================================

std::unique_ptr<ChildrenStorage> OnDisappearModifier::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<DisappearChildren>(
        std::vector<AnyView>{child()}, backend, snapshot, environment, m_action);
}

LayoutResult OnDisappearModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    storage_cast<DisappearChildren>(children).set_action(m_action);
    return pass_through(layout_child(children, proposal, environment));
}

void OnDisappearModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    commit_child(widget, children, layout, Point{}, backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// EnvironmentModifier
// =============================================================================

Environment EnvironmentModifier::child_environment(const Environment& environment) const {
    return m_transform(environment.scoped());
}

std::unique_ptr<ChildrenStorage> EnvironmentModifier::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<TupleChildren>(
        std::vector<AnyView>{child()}, backend, snapshot, child_environment(environment));
}

LayoutResult EnvironmentModifier::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& /*backend*/) const {
    return pass_through(layout_child(children, proposal, child_environment(environment)));
}

void EnvironmentModifier::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    commit_child(widget, children, layout, Point{}, backend);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// AnyView modifiers
// =============================================================================

AnyView AnyView::padding(int amount) const {
    return padding(EdgeInsets::all(amount));
}

AnyView AnyView::padding(EdgeInsets insets) const {
    return PaddingModifier(*this, insets);
}

AnyView AnyView::frame(std::optional<int> width, std::optional<int> height, Alignment alignment) const {
    return FrameModifier(*this, width, height, alignment);
}

AnyView AnyView::frame(const FlexibleFrameOptions& options) const {
    return FlexibleFrameModifier(*this, options);
}

AnyView AnyView::fixed_size(bool horizontal, bool vertical) const {
    return FixedSizeModifier(*this, horizontal, vertical);
}

AnyView AnyView::on_disappear(std::function<void()> action) const {
    return OnDisappearModifier(*this, std::move(action));
}

AnyView AnyView::foreground_color(Color color) const {
    return environment([color](const Environment& env) {
        return env.with(&EnvironmentValues::foreground_color, color);
    });
}

AnyView AnyView::font(Font font) const {
    return environment([font](const Environment& env) {
        return env.with(&EnvironmentValues::font, font);
    });
}

AnyView AnyView::environment(std::function<Environment(const Environment&)> transform) const {
    return EnvironmentModifier(*this, std::move(transform));
}

} // namespace loom_ui
