#pragma once

/// @file orthoedge.h
/// @brief Main header for the OrthoEdge connector library
///
/// OrthoEdge cleans up orthogonal connector paths between two nodes of a
/// diagram and lets users drag individual segments of those paths.
///
/// Example usage:
/// @code
/// #include <orthoedge/orthoedge.h>
///
/// orthoedge::RouteRequest request;
/// request.sourceRect = {0, 0, 100, 50};
/// request.source = {{100, 25}, orthoedge::Side::Right};
/// request.targetRect = {200, 150, 100, 50};
/// request.target = {{200, 175}, orthoedge::Side::Left};
/// request.rawPoints = {{160, 25}, {160, 175}};
///
/// orthoedge::RouteBuilder builder;
/// auto route = builder.build(request);
///
/// orthoedge::SegmentDragController drag(std::make_shared<orthoedge::ViewportTransform>());
/// drag.startDrag(route.chain, 2);
/// @endcode

// Core module - points, rects and geometry primitives
#include "core/Types.h"
#include "core/GeometryUtils.h"
#include "core/IdGenerator.h"

// Configuration
#include "config/ConnectorConfig.h"

// Path module - cleanup, intersection tests, editing
#include "path/PathOptimizer.h"
#include "path/PathIntersection.h"
#include "path/PathEditor.h"
#include "path/RouteBuilder.h"

// Interactive module - segment chain and drag
#include "interactive/ICoordinateTransform.h"
#include "interactive/SegmentChain.h"
#include "interactive/SegmentDragController.h"

#include <string>

namespace orthoedge {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace orthoedge
