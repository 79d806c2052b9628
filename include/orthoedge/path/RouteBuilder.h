#pragma once

#include "orthoedge/config/ConnectorConfig.h"
#include "orthoedge/core/Types.h"
#include "orthoedge/interactive/SegmentChain.h"
#include "orthoedge/path/PathOptimizer.h"

#include <utility>
#include <vector>

namespace orthoedge {

/// Everything needed to turn a pathfinder proposal into a connector
struct RouteRequest {
    Rect sourceRect;
    AnchorPoint source;
    Rect targetRect;
    AnchorPoint target;
    std::vector<Point> rawPoints;   ///< Waypoints between the two offset points
    std::vector<Rect> obstacles;    ///< Other nodes the connector must not cross
};

/// A cleaned connector with its drag metadata
struct ConnectorRoute {
    OptimizedPath path;
    SegmentChain chain;
    std::vector<size_t> blockedSegments;    ///< Chain indices crossing an obstacle

    bool isClear() const { return blockedSegments.empty(); }
    std::vector<Point> points() const { return path.allPoints(); }
};

/// Glue between the geometry primitives, the optimizer and the segment chain.
///
/// RouteBuilder does not choose a route. It offsets the anchors, asks for the
/// routing candidates a pathfinder may use, and cleans and validates what the
/// pathfinder proposed.
class RouteBuilder {
public:
    RouteBuilder() = default;
    explicit RouteBuilder(const ConnectorConfig& config);

    /// Offset points for both anchors (config.anchorOffset away from the node)
    std::pair<Point, Point> offsetsFor(const RouteRequest& request) const;

    /// Candidate waypoints for a pathfinder; empty when the offsets are aligned
    std::vector<Point> candidatesFor(const RouteRequest& request) const;

    /// Optimize the proposed waypoints, check them against the obstacles
    /// (expanded by config.obstacleMargin) and build the segment chain
    ConnectorRoute build(const RouteRequest& request) const;

    /// Re-check an edited point list (after drags) against obstacles
    std::vector<size_t> validate(const std::vector<Point>& points,
                                 const std::vector<Rect>& obstacles) const;

    const ConnectorConfig& config() const { return optimizer_.config(); }

private:
    PathOptimizer optimizer_;
};

}  // namespace orthoedge
