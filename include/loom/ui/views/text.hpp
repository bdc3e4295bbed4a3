#pragma once

/// @file text.hpp
/// @brief Static text

#include <loom/ui/view.hpp>

#include <string>

namespace loom_ui {

/// A run of text that wraps to the proposed width.
///
/// Sizing:
/// - ideal: the unconstrained measurement
/// - minimum width: the measurement at width 1 (the longest word), reported
///   as 0 when it is exactly 1
/// - maximum: the ideal width and the height at the proposed width
class Text : public ElementaryView {
public:
    explicit Text(std::string content) : m_content(std::move(content)) {}

    [[nodiscard]] const std::string& content() const noexcept { return m_content; }

    [[nodiscard]] std::string name() const override { return "Text"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override;

    [[nodiscard]] LayoutResult layout_leaf(
        WidgetHandle widget, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit_leaf(
        WidgetHandle widget, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    std::string m_content;
};

} // namespace loom_ui
