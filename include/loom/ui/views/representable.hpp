#pragma once

/// @file representable.hpp
/// @brief Leaf views wrapping a backend-native widget
///
/// A representable is written against one concrete backend type. Rendering
/// it with any other backend is a contract violation.
///
/// @code
/// struct Slider : WidgetRepresentable<GtkBackend> {
///     WidgetHandle make_widget(GtkBackend& backend, Context& context) const override {
///         return backend.create_scale();
///     }
///     void update_widget(GtkBackend& backend, WidgetHandle widget, Context& context) const override {
///         backend.set_scale_value(widget, m_value);
///     }
/// };
/// @endcode

#include <loom/ui/children.hpp>
#include <loom/ui/view.hpp>

#include <loom/core/error.hpp>
#include <loom/core/log.hpp>

#include <optional>
#include <string>
#include <typeinfo>
#include <variant>

namespace loom_ui {

/// Coordinator and environment handed to representable callbacks
template<typename Coordinator>
struct RepresentableContext {
    Coordinator& coordinator;
    const Environment& environment;
};

template<typename BackendT, typename Coordinator = std::monostate>
class WidgetRepresentable : public View {
public:
    using Context = RepresentableContext<Coordinator>;

    // -------------------------------------------------------------------------
    // Customization points
    // -------------------------------------------------------------------------

    /// Object that lives as long as the node, created before the widget
    [[nodiscard]] virtual Coordinator make_coordinator() const { return Coordinator{}; }

    [[nodiscard]] virtual WidgetHandle make_widget(BackendT& backend, Context& context) const = 0;

    /// Push the view's current values into the widget
    virtual void update_widget(BackendT& /*backend*/, WidgetHandle /*widget*/, Context& /*context*/) const {}

    /// Size of the widget for `proposal`. Defaults to the backend's natural
    /// size and its measurements under the proposed lengths.
    [[nodiscard]] virtual ViewSize determine_view_size(
        BackendT& backend, WidgetHandle widget, const SizeProposal& proposal, Context& /*context*/) const {
        const Size ideal = backend.natural_size(widget);
        const Size concrete = proposal.evaluated(ideal);

        const auto fitting_width = backend.measure(widget, Orientation::Vertical, concrete.width);
        const auto fitting_height = backend.measure(widget, Orientation::Horizontal, concrete.height);

        return ViewSize(
            Size{concrete.width, fitting_width.natural},
            ideal,
            fitting_height.natural,
            fitting_width.natural,
            fitting_height.minimum,
            fitting_width.minimum,
            std::nullopt,
            std::nullopt);
    }

    /// Release anything the coordinator holds for the widget; runs before the
    /// widget is destroyed
    virtual void dismantle_widget(BackendT& /*backend*/, WidgetHandle /*widget*/, Coordinator& /*coordinator*/) const {}

    // -------------------------------------------------------------------------
    // View
    // -------------------------------------------------------------------------

    [[nodiscard]] std::unique_ptr<ChildrenStorage> children(
        IBackend& backend, const NodeSnapshot* /*snapshot*/, const Environment& environment) const final {
        return std::make_unique<Storage>(*this, require_backend(backend), environment);
    }

    [[nodiscard]] WidgetHandle as_widget(ChildrenStorage& children, IBackend& backend) const final {
        auto& storage = storage_cast<Storage>(children);
        Context context{storage.coordinator, storage.environment};
        storage.widget = make_widget(require_backend(backend), context);
        return storage.widget;
    }

    [[nodiscard]] LayoutResult compute_layout(
        WidgetHandle widget, ChildrenStorage& children, const SizeProposal& proposal,
        const Environment& environment, IBackend& backend) const final {
        auto& native = require_backend(backend);
        auto& storage = storage_cast<Storage>(children);
        storage.environment = environment;
        storage.representable = this;

        Context context{storage.coordinator, storage.environment};
        update_widget(native, widget, context);
        return LayoutResult::leaf_view(determine_view_size(native, widget, proposal, context));
    }

    void commit(
        WidgetHandle widget, ChildrenStorage& /*children*/, const LayoutResult& layout,
        const Environment& /*environment*/, IBackend& backend) const final {
        backend.set_size(widget, layout.size.size);
    }

private:
    /// Coordinator and last environment of a representable node
    class Storage : public ChildrenStorage {
    public:
        Storage(const WidgetRepresentable& view, BackendT& backend, const Environment& env)
            : representable(&view), environment(env), coordinator(view.make_coordinator()), m_backend(backend) {}

        void teardown() override {
            if (widget.is_valid()) {
                representable->dismantle_widget(m_backend, widget, coordinator);
            }
        }

        /// Most recent view value; the node keeps it alive
        const WidgetRepresentable* representable;
        Environment environment;
        Coordinator coordinator;
        WidgetHandle widget;

    private:
        BackendT& m_backend;
    };

    static BackendT& require_backend(IBackend& backend) {
        auto* native = dynamic_cast<BackendT*>(&backend);
        if (native == nullptr) {
            loom_core::contract_violation(std::string("representable view for ") + typeid(BackendT).name()
                + " rendered by backend '" + backend.name() + "'");
        }
        return *native;
    }
};

} // namespace loom_ui
