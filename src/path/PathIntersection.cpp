#include "orthoedge/path/PathIntersection.h"
#include "orthoedge/core/GeometryUtils.h"

#include <algorithm>

namespace orthoedge {

namespace PathIntersection {

bool segmentsIntersect(const Point& p0, const Point& p1,
                       const Point& p2, const Point& p3) {
    float s1x = p1.x - p0.x;
    float s1y = p1.y - p0.y;
    float s2x = p3.x - p2.x;
    float s2y = p3.y - p2.y;

    float denominator = s1x * s2y - s2x * s1y;
    if (denominator == 0.0f) {
        // Parallel or collinear
        return false;
    }

    float s = (s1x * (p0.y - p2.y) - s1y * (p0.x - p2.x)) / denominator;
    float t = (s2x * (p0.y - p2.y) - s2y * (p0.x - p2.x)) / denominator;

    return s >= 0.0f && s <= 1.0f && t >= 0.0f && t <= 1.0f;
}

bool segmentCrossesRect(const Point& p1, const Point& p2, const Rect& rect) {
    if (rect.isDegenerate()) {
        return false;
    }

    const auto corners = geometry::verticesOf(rect);
    for (size_t i = 0; i < corners.size(); ++i) {
        if (segmentsIntersect(p1, p2, corners[i], corners[(i + 1) % corners.size()])) {
            return true;
        }
    }
    return false;
}

bool pathCrossesRect(const std::vector<Point>& points, const Rect& rect) {
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        if (segmentCrossesRect(points[i], points[i + 1], rect)) {
            return true;
        }
    }
    return false;
}

std::vector<size_t> findBlockedSegments(const std::vector<Point>& points,
                                        const std::vector<Rect>& obstacles) {
    std::vector<size_t> blocked;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        bool crosses = std::any_of(obstacles.begin(), obstacles.end(),
            [&](const Rect& r) { return segmentCrossesRect(points[i], points[i + 1], r); });
        if (crosses) {
            blocked.push_back(i);
        }
    }
    return blocked;
}

}  // namespace PathIntersection

}  // namespace orthoedge
