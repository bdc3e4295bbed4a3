#pragma once

/// @file test_views.hpp
/// @brief Leaf views with scripted sizes and lifecycle recording for tests

#include <loom/ui/ui.hpp>

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom_ui {

/// Sizing of a test leaf along one axis
struct AxisSpec {
    int ideal = 10;
    int minimum = 0;
    std::optional<int> maximum;

    [[nodiscard]] int resolve(std::optional<int> proposed) const {
        if (!proposed) {
            return ideal;
        }
        return std::clamp(*proposed, minimum, maximum.value_or(std::numeric_limits<int>::max()));
    }
};

/// Leaf that takes whatever it is proposed within its bounds
class FlexView : public ElementaryView {
public:
    FlexView(AxisSpec width, AxisSpec height) : m_width(width), m_height(height) {}

    /// Flexible along the major axis of `orientation`, fixed at 10 across it
    static FlexView along(Orientation orientation, int ideal, int minimum, std::optional<int> maximum) {
        const AxisSpec major{ideal, minimum, maximum};
        const AxisSpec cross{10, 10, 10};
        return orientation == Orientation::Horizontal ? FlexView(major, cross) : FlexView(cross, major);
    }

    [[nodiscard]] std::string name() const override { return "FlexView"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override {
        return backend.create_container();
    }

    [[nodiscard]] LayoutResult layout_leaf(
        WidgetHandle /*widget*/, const SizeProposal& proposal,
        const Environment& /*environment*/, IBackend& /*backend*/) const override {
        return LayoutResult::leaf_view(ViewSize(
            Size{m_width.resolve(proposal.width), m_height.resolve(proposal.height)},
            Size{m_width.ideal, m_height.ideal},
            m_width.minimum, m_height.minimum,
            m_width.maximum, m_height.maximum));
    }

    void commit_leaf(
        WidgetHandle widget, const LayoutResult& layout,
        const Environment& /*environment*/, IBackend& backend) const override {
        backend.set_size(widget, layout.size.size);
    }

private:
    AxisSpec m_width;
    AxisSpec m_height;
};

/// What a capture view saw during its last layout and commit
struct EnvironmentCapture {
    std::optional<Environment> last;
    std::size_t layouts = 0;
    std::size_t commits = 0;
};

/// Fixed 10x10 leaf recording the environment it is laid out with
class CaptureView : public ElementaryView {
public:
    explicit CaptureView(std::shared_ptr<EnvironmentCapture> capture) : m_capture(std::move(capture)) {}

    [[nodiscard]] std::string name() const override { return "CaptureView"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override {
        return backend.create_container();
    }

    [[nodiscard]] LayoutResult layout_leaf(
        WidgetHandle /*widget*/, const SizeProposal& /*proposal*/,
        const Environment& environment, IBackend& /*backend*/) const override {
        m_capture->last = environment;
        ++m_capture->layouts;
        return LayoutResult::leaf_view(ViewSize::fixed(Size{10, 10}));
    }

    void commit_leaf(
        WidgetHandle widget, const LayoutResult& layout,
        const Environment& /*environment*/, IBackend& backend) const override {
        ++m_capture->commits;
        backend.set_size(widget, layout.size.size);
    }

private:
    std::shared_ptr<EnvironmentCapture> m_capture;
};

/// Ordered record of widget creations and disappear actions
using EventLog = std::shared_ptr<std::vector<std::string>>;

/// Fixed-size leaf that logs "create:<tag>" when its widget is created
class TaggedView : public ElementaryView {
public:
    TaggedView(std::string tag, EventLog log, Size size = Size{20, 10})
        : m_tag(std::move(tag)), m_log(std::move(log)), m_size(size) {}

    [[nodiscard]] std::string name() const override { return "TaggedView"; }

protected:
    [[nodiscard]] WidgetHandle create_widget(IBackend& backend) const override {
        m_log->push_back("create:" + m_tag);
        return backend.create_container();
    }

    [[nodiscard]] LayoutResult layout_leaf(
        WidgetHandle /*widget*/, const SizeProposal& /*proposal*/,
        const Environment& /*environment*/, IBackend& /*backend*/) const override {
        return LayoutResult::leaf_view(ViewSize::fixed(m_size));
    }

    void commit_leaf(
        WidgetHandle widget, const LayoutResult& layout,
        const Environment& /*environment*/, IBackend& backend) const override {
        backend.set_size(widget, layout.size.size);
    }

private:
    std::string m_tag;
    EventLog m_log;
    Size m_size;
};

/// A second leaf kind, for kind-switch tests
class OtherTaggedView : public TaggedView {
public:
    using TaggedView::TaggedView;

    [[nodiscard]] std::string name() const override { return "OtherTaggedView"; }
};

// =============================================================================
// Widget tree queries
// =============================================================================

/// Widgets of `kind` under `root` (itself included), depth first
inline std::vector<const HeadlessWidget*> find_all(const HeadlessBackend& backend, WidgetHandle root,
                                                   HeadlessWidgetKind kind) {
    std::vector<const HeadlessWidget*> found;
    std::vector<WidgetHandle> pending{root};
    while (!pending.empty()) {
        const auto handle = pending.back();
        pending.pop_back();
        const auto* widget = backend.find(handle);
        if (!widget) {
            continue;
        }
        if (widget->kind == kind) {
            found.push_back(widget);
        }
        for (auto it = widget->children.rbegin(); it != widget->children.rend(); ++it) {
            pending.push_back(*it);
        }
    }
    return found;
}

/// First widget of `kind` under `root`, or nullptr
inline const HeadlessWidget* find_first(const HeadlessBackend& backend, WidgetHandle root,
                                        HeadlessWidgetKind kind) {
    auto found = find_all(backend, root, kind);
    return found.empty() ? nullptr : found.front();
}

} // namespace loom_ui
