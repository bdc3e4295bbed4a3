/// @file text.cpp
/// @brief Text view

#include <loom/ui/views/text.hpp>

namespace loom_ui {

WidgetHandle Text::create_widget(IBackend& backend) const {
    return backend.create_text_view();
}

LayoutResult Text::layout_leaf(
    WidgetHandle widget, const SizeProposal& proposal,
    const Environment& environment, IBackend& backend) const {
    // Text measurement goes through the widget's font, so the widget must
    // hold the current content even during dry runs.
    backend.update_text_view(widget, m_content, environment);

    const Size ideal = backend.text_size(m_content, widget, std::nullopt, environment);

    Size size;
    int minimum_width = 0;
    int minimum_height = 0;
    if (auto concrete = proposal.concrete()) {
        size = backend.text_size(m_content, widget, *concrete, environment);
        minimum_width = backend.text_size(m_content, widget, Size{1, concrete->height}, environment).width;
        minimum_height = backend.text_size(m_content, widget, Size{concrete->width, 1}, environment).height;
    } else if (proposal.width) {
        size = backend.text_size(m_content, widget, Size{*proposal.width, 1}, environment);
        minimum_width = backend.text_size(m_content, widget, Size{1, size.height}, environment).width;
        minimum_height = size.height;
    } else {
        size = ideal;
        minimum_width = size.width;
        minimum_height = size.height;
    }

    return LayoutResult::leaf_view(ViewSize(
        size,
        ideal,
        ideal.width,
        size.height,
        minimum_width == 1 ? 0 : minimum_width,
        minimum_height,
        ideal.width,
        size.height));
}

void Text::commit_leaf(
    WidgetHandle widget, const LayoutResult& layout,
    const Environment& /*environment*/, IBackend& backend) const {
    backend.set_size(widget, layout.size.size);
}

} // namespace loom_ui
