#pragma once

#include "Types.h"

#include <array>
#include <initializer_list>
#include <vector>

namespace orthoedge {

/// Geometry primitives for connector routing.
/// Every function is pure; degenerate input yields a well-defined value
/// (empty list, zero box) instead of an error.
namespace geometry {

/// Top/right/bottom/left of a box
RectSides sidesOf(const Rect& rect);

/// Corner points clockwise from top-left: TL, TR, BR, BL
std::array<Point, 4> verticesOf(const Rect& rect);

/// Corner points of a box given by its sides, clockwise from top-left
std::array<Point, 4> verticesFromSides(const RectSides& sides);

/// Grow a box by offset on every side (obstacle clearance)
Rect expand(const Rect& rect, float offset);

/// Overlap test comparing the distance between the two box centres with half
/// of their summed extents, per axis. Touching boxes do not overlap.
bool overlaps(const Rect& a, const Rect& b);

/// True if the point lies inside the box or on its boundary
bool contains(const Point& point, const Rect& rect);

/// Min/max x and y over a point set (all zero for an empty set)
RectSides boundingSidesOf(const std::vector<Point>& points);

/// Routing candidates between two anchors.
///
/// Produces the four edge midpoints of the box spanned by the two offset
/// points (top, right, bottom, left) followed by the four edge midpoints of
/// the box enclosing both node rects (outer top, right, bottom, left), then
/// drops candidates that fall inside either node rect.
///
/// When the offsets share an x or a y coordinate they do not span a box and
/// the result is empty; the caller falls back to a direct route.
std::vector<Point> centerCandidates(
    const Rect& sourceRect,
    const Point& sourceOffset,
    const Rect& targetRect,
    const Point& targetOffset);

/// Corners (TL, TR, BR, BL) of the box enclosing a rect and one outside vertex
std::array<Point, 4> verticesAroundRectVertex(const Rect& rect, const Point& vertex);

/// Smallest box covering every input (zero box for no input)
Rect mergeRects(const std::vector<Rect>& rects);
Rect mergeRects(std::initializer_list<Rect> rects);

/// Move an anchor outward from its node by distance
/// (Top: -y, Bottom: +y, Left: -x, Right: +x)
Point offsetFromAnchor(const AnchorPoint& anchor, float distance);

/// p lies on the axis-aligned segment p1-p2, endpoints included
bool isInLine(const Point& p, const Point& p1, const Point& p2);

/// p lies on the axis-aligned line through p1 and p2
bool isOnLine(const Point& p, const Point& p1, const Point& p2);

/// Midpoint of a segment
Point lineCenter(const Point& start, const Point& end);

}  // namespace geometry

namespace constants {

/// Default per-axis distance under which coordinates are merged
constexpr float DEFAULT_MERGE_THRESHOLD = 4.0f;

/// Default distance between an anchor and its offset point
constexpr float DEFAULT_ANCHOR_OFFSET = 20.0f;

/// Default clearance added around obstacles before validation
constexpr float DEFAULT_OBSTACLE_MARGIN = 10.0f;

}  // namespace constants

}  // namespace orthoedge
