#pragma once

/// @file controls.hpp
/// @brief Native controls: buttons, pickers, progress indicators, spacers

#include <loom/ui/binding.hpp>
#include <loom/ui/view.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loom_ui {

// =============================================================================
// Button
// =============================================================================

/// Push button sized to its label. A forced width replaces the natural width.
class Button : public ElementaryView {
public:
    explicit Button(std::string label, std::function<void()> action = {}, std::optional<int> width = std::nullopt)
        : m_label(std::move(label)), m_action(std::move(action)), m_width(width) {}

    [[nodiscard]] Button with_width(std::optional<int> width) const {
        return Button(m_label, m_action, width);
    }

    [[nodiscard]] const std::string& label() const noexcept { return m_label; }
    [[nodiscard]] std::string name() const override { return "Button"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;

private:
    std::string m_label;
    std::function<void()> m_action;
    std::optional<int> m_width;
};

// =============================================================================
// Picker
// =============================================================================

/// Drop-down choice among string options, bound to the selected index.
///
/// Some toolkits report a natural size of -1x-1 for pickers that have not been
/// realized yet. Such pickers take the proposal with an ideal size of 10x10.
class Picker : public ElementaryView {
public:
    Picker(std::vector<std::string> options, Binding<std::optional<std::size_t>> selection)
        : m_options(std::move(options)), m_selection(std::move(selection)) {}

    [[nodiscard]] std::string name() const override { return "Picker"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;

private:
    std::vector<std::string> m_options;
    Binding<std::optional<std::size_t>> m_selection;
};

// =============================================================================
// Progress
// =============================================================================

/// Horizontal progress bar; no fraction shows an indeterminate bar
class ProgressBar : public ElementaryView {
public:
    explicit ProgressBar(std::optional<double> fraction = std::nullopt) : m_fraction(fraction) {}

    [[nodiscard]] std::string name() const override { return "ProgressBar"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;

private:
    std::optional<double> m_fraction;
};

class ProgressSpinner : public ElementaryView {
public:
    [[nodiscard]] std::string name() const override { return "ProgressSpinner"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;
};

// =============================================================================
// Spacer
// =============================================================================

/// Flexible gap along the enclosing stack's orientation
class Spacer : public ElementaryView {
public:
    explicit Spacer(std::optional<int> min_length = std::nullopt) : m_min_length(min_length) {}

    [[nodiscard]] std::string name() const override { return "Spacer"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;
    [[nodiscard]] LayoutResult layout_leaf(WidgetHandle widget, const SizeProposal& proposal,
                                           const Environment& environment, IBackend& backend) const override;
    void commit_leaf(WidgetHandle widget, const LayoutResult& layout,
                     const Environment& environment, IBackend& backend) const override;

private:
    std::optional<int> m_min_length;
};

} // namespace loom_ui
