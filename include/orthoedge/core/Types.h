#pragma once

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace orthoedge {

/// Control point of a connector path.
/// The id is identity only (list diffing, handle keys); equality compares
/// coordinates.
struct Point {
    float x = 0.0f;
    float y = 0.0f;
    std::string id;

    Point() = default;
    Point(float x_, float y_) : x(x_), y(y_) {}
    Point(float x_, float y_, std::string id_) : x(x_), y(y_), id(std::move(id_)) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    Point operator*(float s) const { return {x * s, y * s}; }
    Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Which side of its node an anchor protrudes from.
/// Screen coordinates: +x right, +y down.
enum class Side {
    Top,
    Right,
    Bottom,
    Left
};

/// True when a path leaves an anchor on this side along the x axis
constexpr bool isHorizontal(Side side) {
    return side == Side::Left || side == Side::Right;
}

constexpr const char* toString(Side side) {
    switch (side) {
        case Side::Top: return "top";
        case Side::Right: return "right";
        case Side::Bottom: return "bottom";
        case Side::Left: return "left";
    }
    return "unknown";
}

/// Edge coordinates of an axis-aligned box
struct RectSides {
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;

    constexpr bool operator==(const RectSides& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
    constexpr bool operator!=(const RectSides& o) const { return !(*this == o); }
};

/// Axis-aligned box, (x, y) is the top-left corner
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}

    Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    /// Zero-area boxes are treated as "no obstacle" by intersection tests
    constexpr bool isDegenerate() const { return width == 0.0f && height == 0.0f; }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// A point on a node boundary where a connector attaches
struct AnchorPoint {
    Point point;
    Side side = Side::Bottom;

    AnchorPoint() = default;
    AnchorPoint(Point p, Side s) : point(std::move(p)), side(s) {}
};

using PointList = std::vector<Point>;

}  // namespace orthoedge
