#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for loom_ui module

#include <cstdint>

namespace loom_ui {

// Geometry
struct Point;
struct Size;
struct Rect;
struct EdgeInsets;
struct Color;
struct Font;
struct Alignment;

// Layout
struct SizeProposal;
struct ViewSize;
struct LayoutResult;
struct LayoutableChild;
class LayoutSystem;

// Environment
struct EnvironmentValues;
class Environment;
struct EngineConfig;
struct BackendCalibration;

// Backend
struct WidgetHandle;
struct PathHandle;
class IBackend;
class HeadlessBackend;
struct RgbaImage;
class Path;

// View graph
class View;
class ElementaryView;
class AnyView;
class ChildrenStorage;
class EmptyChildren;
class TupleChildren;
class ErasedListChildren;
class GraphNode;
class ViewGraph;
struct NodeSnapshot;

} // namespace loom_ui
