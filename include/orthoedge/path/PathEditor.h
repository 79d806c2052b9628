#pragma once

#include "orthoedge/core/Types.h"
#include "orthoedge/interactive/SegmentDragController.h"

#include <vector>

namespace orthoedge {

/// Applies drag events to a connector's point list.
/// This is the reference consumer of SegmentDragEvent; hosts with their own
/// coordination layer may ignore it.
namespace PathEditor {

    /// Move the segment described by event.from to event.to.
    /// Finds the consecutive pair equal to event.from and overwrites their
    /// coordinates, keeping ids. The segments before and after share those
    /// points and stretch to meet the new position.
    /// @return false if no segment of points matches event.from
    bool applySegmentDrag(std::vector<Point>& points, const SegmentDragEvent& event);

    /// Drop points that became redundant after a drag (a dragged segment
    /// landing on a partner's line), keeping both endpoints.
    std::vector<Point> simplify(const std::vector<Point>& points);

}  // namespace PathEditor

}  // namespace orthoedge
