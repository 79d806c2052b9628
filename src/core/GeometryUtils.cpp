#include "orthoedge/core/GeometryUtils.h"
#include "orthoedge/core/IdGenerator.h"

#include <algorithm>
#include <cmath>

namespace orthoedge::geometry {

RectSides sidesOf(const Rect& rect) {
    return {rect.top(), rect.right(), rect.bottom(), rect.left()};
}

std::array<Point, 4> verticesFromSides(const RectSides& sides) {
    return {
        Point{sides.left, sides.top, ids::nextPointId()},
        Point{sides.right, sides.top, ids::nextPointId()},
        Point{sides.right, sides.bottom, ids::nextPointId()},
        Point{sides.left, sides.bottom, ids::nextPointId()},
    };
}

std::array<Point, 4> verticesOf(const Rect& rect) {
    return verticesFromSides(sidesOf(rect));
}

Rect expand(const Rect& rect, float offset) {
    return {rect.x - offset, rect.y - offset,
            rect.width + 2 * offset, rect.height + 2 * offset};
}

bool overlaps(const Rect& a, const Rect& b) {
    Point ca = a.center();
    Point cb = b.center();
    return std::abs(ca.x - cb.x) < (a.width + b.width) / 2 &&
           std::abs(ca.y - cb.y) < (a.height + b.height) / 2;
}

bool contains(const Point& point, const Rect& rect) {
    return point.x >= rect.left() && point.x <= rect.right() &&
           point.y >= rect.top() && point.y <= rect.bottom();
}

RectSides boundingSidesOf(const std::vector<Point>& points) {
    if (points.empty()) {
        return {};
    }

    auto [minX, maxX] = std::minmax_element(points.begin(), points.end(),
        [](const Point& a, const Point& b) { return a.x < b.x; });
    auto [minY, maxY] = std::minmax_element(points.begin(), points.end(),
        [](const Point& a, const Point& b) { return a.y < b.y; });

    return {minY->y, maxX->x, maxY->y, minX->x};
}

std::vector<Point> centerCandidates(
    const Rect& sourceRect,
    const Point& sourceOffset,
    const Rect& targetRect,
    const Point& targetOffset) {

    if (sourceOffset.x == targetOffset.x || sourceOffset.y == targetOffset.y) {
        return {};
    }

    std::vector<Point> vertices;
    vertices.reserve(8);
    for (const auto& v : verticesOf(sourceRect)) vertices.push_back(v);
    for (const auto& v : verticesOf(targetRect)) vertices.push_back(v);
    RectSides outer = boundingSidesOf(vertices);

    RectSides inner = boundingSidesOf({sourceOffset, targetOffset});
    float centerX = (inner.left + inner.right) / 2;
    float centerY = (inner.top + inner.bottom) / 2;

    std::vector<Point> candidates = {
        {centerX, inner.top, ids::nextPointId()},
        {inner.right, centerY, ids::nextPointId()},
        {centerX, inner.bottom, ids::nextPointId()},
        {inner.left, centerY, ids::nextPointId()},
        {centerX, outer.top, ids::nextPointId()},
        {outer.right, centerY, ids::nextPointId()},
        {centerX, outer.bottom, ids::nextPointId()},
        {outer.left, centerY, ids::nextPointId()},
    };

    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
            [&](const Point& p) {
                return contains(p, sourceRect) || contains(p, targetRect);
            }),
        candidates.end());

    return candidates;
}

std::array<Point, 4> verticesAroundRectVertex(const Rect& rect, const Point& vertex) {
    std::vector<Point> points = {vertex};
    for (const auto& v : verticesOf(rect)) points.push_back(v);
    return verticesFromSides(boundingSidesOf(points));
}

Rect mergeRects(const std::vector<Rect>& rects) {
    if (rects.empty()) {
        return {};
    }

    float left = rects.front().left();
    float right = rects.front().right();
    float top = rects.front().top();
    float bottom = rects.front().bottom();

    // Negative extents are allowed, so both ends of each box take part
    for (const auto& r : rects) {
        left = std::min({left, r.left(), r.right()});
        right = std::max({right, r.left(), r.right()});
        top = std::min({top, r.top(), r.bottom()});
        bottom = std::max({bottom, r.top(), r.bottom()});
    }

    return {left, top, right - left, bottom - top};
}

Rect mergeRects(std::initializer_list<Rect> rects) {
    return mergeRects(std::vector<Rect>(rects));
}

Point offsetFromAnchor(const AnchorPoint& anchor, float distance) {
    const Point& p = anchor.point;
    switch (anchor.side) {
        case Side::Top: return {p.x, p.y - distance, ids::nextPointId()};
        case Side::Bottom: return {p.x, p.y + distance, ids::nextPointId()};
        case Side::Left: return {p.x - distance, p.y, ids::nextPointId()};
        case Side::Right: return {p.x + distance, p.y, ids::nextPointId()};
    }
    return {p.x, p.y, ids::nextPointId()};
}

bool isInLine(const Point& p, const Point& p1, const Point& p2) {
    auto [minX, maxX] = std::minmax(p1.x, p2.x);
    auto [minY, maxY] = std::minmax(p1.y, p2.y);
    return (p1.x == p.x && p.x == p2.x && p.y >= minY && p.y <= maxY) ||
           (p1.y == p.y && p.y == p2.y && p.x >= minX && p.x <= maxX);
}

bool isOnLine(const Point& p, const Point& p1, const Point& p2) {
    return (p1.x == p.x && p.x == p2.x) || (p1.y == p.y && p.y == p2.y);
}

Point lineCenter(const Point& start, const Point& end) {
    return {(start.x + end.x) / 2, (start.y + end.y) / 2};
}

}  // namespace orthoedge::geometry
