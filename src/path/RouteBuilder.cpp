#include "orthoedge/path/RouteBuilder.h"
#include "orthoedge/common/Logger.h"
#include "orthoedge/core/GeometryUtils.h"
#include "orthoedge/path/PathIntersection.h"

namespace orthoedge {

RouteBuilder::RouteBuilder(const ConnectorConfig& config)
    : optimizer_(config) {}

std::pair<Point, Point> RouteBuilder::offsetsFor(const RouteRequest& request) const {
    float distance = config().anchorOffset;
    return {geometry::offsetFromAnchor(request.source, distance),
            geometry::offsetFromAnchor(request.target, distance)};
}

std::vector<Point> RouteBuilder::candidatesFor(const RouteRequest& request) const {
    auto [sourceOffset, targetOffset] = offsetsFor(request);
    auto candidates = geometry::centerCandidates(
        request.sourceRect, sourceOffset, request.targetRect, targetOffset);
    if (candidates.empty()) {
        LOG_DEBUG("offsets ({}, {}) and ({}, {}) are aligned, no candidates",
                  sourceOffset.x, sourceOffset.y, targetOffset.x, targetOffset.y);
    }
    return candidates;
}

std::vector<size_t> RouteBuilder::validate(const std::vector<Point>& points,
                                           const std::vector<Rect>& obstacles) const {
    std::vector<Rect> expanded;
    expanded.reserve(obstacles.size());
    for (const auto& obstacle : obstacles) {
        // Zero-area obstacles stay zero-area so they keep meaning "no obstacle"
        expanded.push_back(obstacle.isDegenerate()
            ? obstacle
            : geometry::expand(obstacle, config().obstacleMargin));
    }
    return PathIntersection::findBlockedSegments(points, expanded);
}

ConnectorRoute RouteBuilder::build(const RouteRequest& request) const {
    auto [sourceOffset, targetOffset] = offsetsFor(request);

    OptimizeRequest optimizeRequest;
    optimizeRequest.rawPoints = request.rawPoints;
    optimizeRequest.source = request.source;
    optimizeRequest.target = request.target;
    optimizeRequest.sourceOffset = std::move(sourceOffset);
    optimizeRequest.targetOffset = std::move(targetOffset);

    ConnectorRoute route;
    route.path = optimizer_.optimize(optimizeRequest);

    auto points = route.path.allPoints();
    route.chain = SegmentChain(points);
    route.blockedSegments = validate(points, request.obstacles);

    if (!route.isClear()) {
        LOG_INFO("route crosses obstacles on {} of {} segments",
                 route.blockedSegments.size(), route.chain.size());
    }
    return route;
}

}  // namespace orthoedge
