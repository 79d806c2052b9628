#pragma once

#include "orthoedge/core/Types.h"

#include <vector>

namespace orthoedge {

/// Segment intersection tests used to validate connector paths against
/// obstacle rectangles
namespace PathIntersection {

    /// Parametric segment/segment test.
    /// Parallel and collinear segments never intersect (no overlap check);
    /// touching at an endpoint counts as intersecting.
    /// The result does not depend on the order of the two segments.
    bool segmentsIntersect(const Point& p0, const Point& p1,
                           const Point& p2, const Point& p3);

    /// True if segment p1-p2 crosses any of the four edges of rect.
    /// A zero-area rect is never crossed.
    bool segmentCrossesRect(const Point& p1, const Point& p2, const Rect& rect);

    /// True if any segment of the polyline crosses rect
    bool pathCrossesRect(const std::vector<Point>& points, const Rect& rect);

    /// Indices of polyline segments (i = points[i] -> points[i+1]) that
    /// cross at least one obstacle, in ascending order
    std::vector<size_t> findBlockedSegments(const std::vector<Point>& points,
                                            const std::vector<Rect>& obstacles);

}  // namespace PathIntersection

}  // namespace orthoedge
