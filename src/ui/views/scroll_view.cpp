/// @file scroll_view.cpp
/// @brief Scroll view

#include <loom/ui/views/scroll_view.hpp>

#include <loom/ui/children.hpp>
#include <loom/ui/views/stack.hpp>

#include <loom/core/log.hpp>

#include <algorithm>

namespace loom_ui {

namespace {

class ScrollChildren : public TupleChildren {
public:
    ScrollChildren(const AnyView& body, IBackend& backend, const NodeSnapshot* snapshot,
                   const Environment& environment)
        : TupleChildren({body}, backend, snapshot, environment), m_backend(backend) {
        m_inner_container = backend.create_container();
        backend.add_child(node(0).widget(), m_inner_container);
    }

    [[nodiscard]] WidgetHandle inner_container() const noexcept { return m_inner_container; }

    void teardown() override {
        TupleChildren::teardown();
        m_backend.destroy_widget(m_inner_container);
    }

    ScrollBarState bars;

private:
    IBackend& m_backend;
    WidgetHandle m_inner_container;
};

} // anonymous namespace

ScrollBarState scroll_bar_state(ChildrenStorage& children) {
    return storage_cast<ScrollChildren>(children).bars;
}

ScrollView::ScrollView(std::vector<AnyView> content, Axes axes)
    : m_body(VStack(std::move(content))), m_axes(axes) {}

std::unique_ptr<ChildrenStorage> ScrollView::children(
    IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const {
    return std::make_unique<ScrollChildren>(m_body, backend, snapshot, environment);
}

WidgetHandle ScrollView::as_widget(ChildrenStorage& children, IBackend& backend) const {
    return backend.create_scroll_container(storage_cast<ScrollChildren>(children).inner_container());
}

LayoutResult ScrollView::compute_layout(
    WidgetHandle /*widget*/, ChildrenStorage& children, const SizeProposal& proposal,
    const Environment& environment, IBackend& backend) const {
    LOOM_LOG_SCOPE("ScrollView::compute_layout", "loom.layout");
    auto& storage = storage_cast<ScrollChildren>(children);

    // Probe: ideal along the scroll axes
    const auto probe = storage.update_child(
        0, m_body,
        SizeProposal{m_axes.horizontal ? std::nullopt : proposal.width,
                     m_axes.vertical ? std::nullopt : proposal.height},
        environment);
    const auto& content = probe.size;
    const Size viewport = proposal.evaluated(content.ideal_size);

    const bool has_horizontal = m_axes.horizontal && content.ideal_size.width > viewport.width;
    const bool has_vertical = m_axes.vertical && content.ideal_size.height > viewport.height;
    storage.bars = ScrollBarState{has_vertical, has_horizontal};

    const int bar = backend.scroll_bar_width();
    const int vertical_bar_width = has_vertical ? bar : 0;
    const int horizontal_bar_height = has_horizontal ? bar : 0;

    int width = 0;
    int height = 0;
    int minimum_width = 0;
    int minimum_height = 0;
    if (m_axes.horizontal) {
        width = std::max(viewport.width, vertical_bar_width);
        minimum_width = vertical_bar_width;
    } else {
        width = content.size.width + vertical_bar_width;
        minimum_width = content.minimum_width + vertical_bar_width;
    }
    if (m_axes.vertical) {
        height = std::max(viewport.height, horizontal_bar_height);
        minimum_height = horizontal_bar_height;
    } else {
        height = content.size.height + horizontal_bar_height;
        minimum_height = content.minimum_height + horizontal_bar_height;
    }

    const SizeProposal content_proposal{
        has_horizontal ? content.ideal_size.width : std::max(viewport.width - vertical_bar_width, 0),
        has_vertical ? content.ideal_size.height : std::max(viewport.height - horizontal_bar_height, 0),
    };
    auto final_result = storage.update_child(0, m_body, content_proposal, environment);

    loom_core::layout_logger()->debug("ScrollView {}x{} (scroll bars: vertical={}, horizontal={})",
                                      width, height, has_vertical, has_horizontal);

    return LayoutResult{
        ViewSize(Size{width, height}, content.ideal_size, minimum_width, minimum_height, std::nullopt, std::nullopt),
        {std::move(final_result)},
        true,
    };
}

void ScrollView::commit(
    WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    auto& storage = storage_cast<ScrollChildren>(children);
    const auto inner = storage.inner_container();
    sync_container_widgets(backend, inner, storage);

    storage.node(0).commit();

    const Size viewport = layout.size.size;
    const Size content = layout.child_results.front().size.size;
    const int bar = backend.scroll_bar_width();
    const int clip_width = viewport.width - (storage.bars.vertical ? bar : 0);
    const int clip_height = viewport.height - (storage.bars.horizontal ? bar : 0);

    Point position;
    Size inner_size = content;
    if (m_axes.vertical && content.width < clip_width) {
        position.x = (clip_width - content.width) / 2;
        inner_size.width = clip_width;
    }
    if (m_axes.horizontal && content.height < clip_height) {
        position.y = (clip_height - content.height) / 2;
        inner_size.height = clip_height;
    }

    backend.set_size(widget, viewport);
    backend.set_size(inner, inner_size);
    backend.set_position(inner, 0, position);
    backend.set_scroll_bar_presence(widget, storage.bars.vertical, storage.bars.horizontal);
}

} // namespace loom_ui
