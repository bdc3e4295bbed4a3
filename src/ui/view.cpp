/// @file view.cpp
/// @brief AnyView and ElementaryView

#include <loom/ui/view.hpp>
#include <loom/ui/children.hpp>

#include <loom/core/error.hpp>

namespace loom_ui {

AnyView::AnyView(std::shared_ptr<const View> view)
    : m_view(std::move(view)) {
    if (!m_view) {
        loom_core::contract_violation("AnyView constructed from a null view");
    }
}

std::unique_ptr<ChildrenStorage> ElementaryView::children(
    IBackend& /*backend*/, const NodeSnapshot* /*snapshot*/, const Environment& /*environment*/) const {
    return std::make_unique<EmptyChildren>();
}

} // namespace loom_ui
