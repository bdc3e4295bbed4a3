#pragma once

/// @file list.hpp
/// @brief Data-driven rows: selectable lists and ForEach

#include <loom/ui/binding.hpp>
#include <loom/ui/view.hpp>

#include <cstddef>
#include <functional>
#include <optional>

namespace loom_ui {

/// Builds the view for row `index`
using RowBuilder = std::function<AnyView(std::size_t index)>;

// =============================================================================
// List
// =============================================================================

/// Selectable list backed by the toolkit's list widget.
///
/// Row views are rebuilt from `row_content` on every layout. Row nodes are
/// reused by position, so the native list keeps its item identities when the
/// backing data changes. Each row is padded to 6 px vertically and 8 px
/// horizontally, including whatever padding the toolkit already applies.
class List : public View {
public:
    List(std::size_t row_count, RowBuilder row_content,
         Binding<std::optional<std::size_t>> selection = Binding<std::optional<std::size_t>>::constant(std::nullopt))
        : m_row_count(row_count), m_row_content(std::move(row_content)), m_selection(std::move(selection)) {}

    [[nodiscard]] std::string name() const override { return "List"; }

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
    std::size_t m_row_count;
    RowBuilder m_row_content;
    Binding<std::optional<std::size_t>> m_selection;
};

// =============================================================================
// ForEach
// =============================================================================

/// A dynamic number of views laid out as a stack along the environment's
/// layout orientation, reusing row nodes by position
class ForEach : public View {
public:
    ForEach(std::size_t count, RowBuilder content)
        : m_count(count), m_content(std::move(content)) {}

    [[nodiscard]] std::string name() const override { return "ForEach"; }

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* snapshot, const Environment& environment) const override;

    [[nodiscard]] std::vector<LayoutableChild> layoutable_children(
        IBackend& backend, ChildrenStorage& children) const override;

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const override;

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const override;

    void commit(
        WidgetHandle widget, ChildrenStorage& children, const LayoutResult& layout,
        const Environment& environment, IBackend& backend) const override;

private:
    [[nodiscard]] std::vector<AnyView> build() const;

    std::size_t m_count;
    RowBuilder m_content;
};

} // namespace loom_ui
