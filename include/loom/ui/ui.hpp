#pragma once

/// @file ui.hpp
/// @brief Main include header for loom_ui
///
/// loom_ui is a declarative, retained-mode UI engine. Views are immutable
/// descriptions; a `ViewGraph` diffs them against persistent graph nodes and
/// drives a native widget backend.
///
/// ## Features
///
/// - **Views**
///   - Text, Button, Image, Picker, ProgressBar, ProgressSpinner, Spacer
///   - VStack, HStack, ZStack, ScrollView, List, ForEach
///   - EitherView / OptionalView conditionals
///   - Rectangle, RoundedRectangle, Ellipse, Circle, Capsule
///   - CompositeView for user views with node-local state
///
/// - **Layout**
///   - Flexible stacks with min/ideal/max negotiation
///   - padding, frame, fixed_size modifiers
///   - Dry-run layout passes
///
/// - **Backends**
///   - `IBackend` capability contract
///   - `HeadlessBackend` with deterministic metrics
///   - `WidgetRepresentable` for backend-native widgets
///
/// ## Quick Start
///
/// ```cpp
/// #include <loom/ui/ui.hpp>
///
/// using namespace loom_ui::prelude;
///
/// HeadlessBackend backend;
/// ViewGraph graph(VStack({
///     Text("Hello"),
///     Button("Press me", [] { LOOM_LOG_INFO("pressed"); }),
/// }), backend);
///
/// graph.update(SizeProposal{400, 300});
/// ```
///
/// ## Snapshots
///
/// ```cpp
/// auto saved = save_snapshot(graph.snapshot(), "state.json");
/// auto snapshot = load_snapshot("state.json");
/// ViewGraph restored(make_root(), backend, config, snapshot ? &*snapshot : nullptr);
/// ```

// Core types
#include "fwd.hpp"
#include "types.hpp"
#include "path.hpp"
#include "view_size.hpp"

// Configuration & environment
#include "config.hpp"
#include "environment.hpp"

// Backends
#include "backend.hpp"
#include "headless_backend.hpp"

// View graph
#include "binding.hpp"
#include "children.hpp"
#include "graph_node.hpp"
#include "layout_system.hpp"
#include "snapshot.hpp"
#include "view.hpp"
#include "view_graph.hpp"

// Views
#include "views/composite.hpp"
#include "views/conditional.hpp"
#include "views/controls.hpp"
#include "views/image.hpp"
#include "views/list.hpp"
#include "views/modifiers.hpp"
#include "views/representable.hpp"
#include "views/scroll_view.hpp"
#include "views/shape.hpp"
#include "views/stack.hpp"
#include "views/text.hpp"

namespace loom_ui {

/// Prelude - commonly used types for convenience
namespace prelude {
    // Types
    using loom_ui::Color;
    using loom_ui::Point;
    using loom_ui::Size;
    using loom_ui::Rect;
    using loom_ui::EdgeInsets;
    using loom_ui::Axes;
    using loom_ui::Alignment;
    using loom_ui::StackAlignment;
    using loom_ui::Orientation;
    using loom_ui::Font;
    using loom_ui::ColorScheme;
    using loom_ui::SizeProposal;
    using loom_ui::ViewSize;
    using loom_ui::LayoutResult;

    // Environment & backends
    using loom_ui::Environment;
    using loom_ui::EnvironmentValues;
    using loom_ui::EngineConfig;
    using loom_ui::IBackend;
    using loom_ui::HeadlessBackend;

    // Graph
    using loom_ui::AnyView;
    using loom_ui::Binding;
    using loom_ui::ViewGraph;
    using loom_ui::NodeSnapshot;

    // Views
    using loom_ui::Text;
    using loom_ui::Button;
    using loom_ui::Image;
    using loom_ui::ImageFile;
    using loom_ui::EncodedImage;
    using loom_ui::Picker;
    using loom_ui::ProgressBar;
    using loom_ui::ProgressSpinner;
    using loom_ui::Spacer;
    using loom_ui::VStack;
    using loom_ui::HStack;
    using loom_ui::ZStack;
    using loom_ui::ScrollView;
    using loom_ui::List;
    using loom_ui::ForEach;
    using loom_ui::EmptyView;
    using loom_ui::EitherView;
    using loom_ui::OptionalView;
    using loom_ui::Rectangle;
    using loom_ui::RoundedRectangle;
    using loom_ui::Ellipse;
    using loom_ui::Circle;
    using loom_ui::Capsule;
    using loom_ui::CompositeView;
    using loom_ui::ViewContext;
    using loom_ui::FlexibleFrameOptions;
} // namespace prelude

} // namespace loom_ui
