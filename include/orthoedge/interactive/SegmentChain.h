#pragma once

#include "orthoedge/core/Types.h"

#include <string>
#include <vector>

namespace orthoedge {

/// Orientation of a path segment. Horizontal iff both ends share y.
enum class SegmentOrientation {
    Horizontal,
    Vertical
};

/// One straight piece of a connector path
struct Segment {
    size_t chainIndex = 0;
    std::string id;             ///< Start point id, used as the drag handle key
    Point start;
    Point end;
    bool draggable = false;     ///< Computed by SegmentChain

    SegmentOrientation orientation() const {
        return start.y == end.y ? SegmentOrientation::Horizontal : SegmentOrientation::Vertical;
    }

    bool isHorizontal() const { return orientation() == SegmentOrientation::Horizontal; }

    /// Zero-length segment
    bool isDegenerate() const { return start == end; }

    /// Purely horizontal or purely vertical
    bool isOrthogonal() const { return start.x == end.x || start.y == end.y; }

    Point center() const;

    /// Box of the drag handle centred on the segment: handlerWidth along the
    /// segment, handlerThickness across it
    Rect handleRect(float handlerWidth, float handlerThickness) const;
};

/// Ordered segments of one connector path.
///
/// Segments live in a flat array; the "partners" of segment i are the
/// segments at i-2 and i+2. Consecutive segments of a rectilinear path
/// alternate orientation, so those are the nearest segments parallel to i.
/// An interior segment is draggable only if it is orthogonal, has length and
/// turns at both ends; a segment continuing its neighbour's line would tilt
/// that neighbour when moved. The chain is rebuilt whenever the path changes.
class SegmentChain {
public:
    SegmentChain() = default;
    explicit SegmentChain(const std::vector<Point>& points);

    const std::vector<Segment>& segments() const { return segments_; }
    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }

    /// nullptr when index is out of range
    const Segment* at(size_t index) const;

    /// Segment at index - 2, or nullptr.
    /// Partners are what a dragged segment can land on: once it shares a
    /// partner's line, PathEditor::simplify collapses the pair.
    const Segment* previousPartner(size_t index) const;

    /// Segment at index + 2, or nullptr
    const Segment* nextPartner(size_t index) const;

    /// True if segment index lies on the line of one of its partners
    bool isOnPartnerLine(size_t index) const;

    /// Segments a renderer should put drag handles on
    std::vector<const Segment*> draggableSegments() const;

    /// Segment whose id equals segmentId, or nullptr
    const Segment* findById(const std::string& segmentId) const;

private:
    std::vector<Segment> segments_;
};

}  // namespace orthoedge
