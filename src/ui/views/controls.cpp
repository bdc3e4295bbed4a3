/// @file controls.cpp
/// @brief Buttons, pickers, progress indicators and spacers

#include <loom/ui/views/controls.hpp>

#include <algorithm>

namespace loom_ui {

// =============================================================================
// Button
// =============================================================================

WidgetHandle Button::create_widget(IBackend& backend) const {
    return backend.create_button();
}

LayoutResult Button::layout_leaf(WidgetHandle widget, const SizeProposal& /*proposal*/,
                                 const Environment& environment, IBackend& backend) const {
    // The natural size is only known once the label is set
    backend.update_button(widget, m_label, environment);
    Size natural = backend.natural_size(widget);
    if (m_width) {
        natural.width = *m_width;
    }
    return LayoutResult::leaf_view(ViewSize::fixed(natural));
}

void Button::commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                         const Environment& /*environment*/, IBackend& backend) const {
    backend.set_button_action(widget, m_action);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// Picker
// =============================================================================

WidgetHandle Picker::create_widget(IBackend& backend) const {
    return backend.create_picker();
}

LayoutResult Picker::layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                 const Environment& environment, IBackend& backend) const {
    backend.update_picker(widget, m_options, environment);

    const Size natural = backend.natural_size(widget);
    if (natural == Size{-1, -1}) {
        const Size ideal{10, 10};
        return LayoutResult::leaf_view(ViewSize(proposal.evaluated(ideal), ideal, 0, 0, std::nullopt, std::nullopt));
    }
    return LayoutResult::leaf_view(ViewSize::fixed(natural));
}

void Picker::commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                         const Environment& /*environment*/, IBackend& backend) const {
    const auto option_count = m_options.size();
    auto selection = m_selection;
    backend.set_picker_change_handler(widget, [selection, option_count](std::optional<std::size_t> index) {
        if (index && *index >= option_count) {
            index.reset();
        }
        selection.set(index);
    });

    auto selected = m_selection.get();
    if (selected && *selected >= option_count) {
        selected.reset();
    }
    backend.set_selected_option(widget, selected);
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// Progress
// =============================================================================

WidgetHandle ProgressBar::create_widget(IBackend& backend) const {
    return backend.create_progress_bar();
}

LayoutResult ProgressBar::layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                      const Environment& /*environment*/, IBackend& backend) const {
    const int height = backend.natural_size(widget).height;
    const Size ideal{100, height};
    return LayoutResult::leaf_view(ViewSize(
        Size{proposal.width.value_or(ideal.width), height}, ideal, 0, height, std::nullopt, height));
}

void ProgressBar::commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                              const Environment& /*environment*/, IBackend& backend) const {
    backend.update_progress_bar(widget, m_fraction);
    backend.set_size(widget, layout.size.size);
}

WidgetHandle ProgressSpinner::create_widget(IBackend& backend) const {
    return backend.create_progress_spinner();
}

LayoutResult ProgressSpinner::layout_leaf(WidgetHandle widget, const SizeProposal& /*proposal*/,
                                          const Environment& /*environment*/, IBackend& backend) const {
    return LayoutResult::leaf_view(ViewSize::fixed(backend.natural_size(widget)));
}

void ProgressSpinner::commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                                  const Environment& /*environment*/, IBackend& backend) const {
    backend.set_size(widget, layout.size.size);
}

// =============================================================================
// Spacer
// =============================================================================

WidgetHandle Spacer::create_widget(IBackend& backend) const {
    return backend.create_container();
}

LayoutResult Spacer::layout_leaf(WidgetHandle /*widget*/, const SizeProposal& proposal,
                                 const Environment& environment, IBackend& /*backend*/) const {
    const int min_length = m_min_length.value_or(0);

    if (environment.layout_orientation() == Orientation::Horizontal) {
        const Size size{std::max(min_length, proposal.width.value_or(min_length)), 0};
        return LayoutResult::leaf_view(ViewSize(size, Size{min_length, 0}, min_length, 0, std::nullopt, 0));
    }

    const Size size{0, std::max(min_length, proposal.height.value_or(min_length))};
    return LayoutResult::leaf_view(ViewSize(size, Size{0, min_length}, 0, min_length, 0, std::nullopt));
}

void Spacer::commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                         const Environment& /*environment*/, IBackend& backend) const {
    backend.set_size(widget, layout.size.size);
}

} // namespace loom_ui
