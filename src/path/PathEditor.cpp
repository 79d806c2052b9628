#include "orthoedge/path/PathEditor.h"
#include "orthoedge/common/Logger.h"
#include "orthoedge/path/PathOptimizer.h"

namespace orthoedge {

namespace PathEditor {

bool applySegmentDrag(std::vector<Point>& points, const SegmentDragEvent& event) {
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        if (points[i] == event.from.start && points[i + 1] == event.from.end) {
            points[i].x = event.to.start.x;
            points[i].y = event.to.start.y;
            points[i + 1].x = event.to.end.x;
            points[i + 1].y = event.to.end.y;
            return true;
        }
    }

    LOG_WARN("{}: no segment at ({}, {}) -> ({}, {})", event.dragId,
             event.from.start.x, event.from.start.y, event.from.end.x, event.from.end.y);
    return false;
}

std::vector<Point> simplify(const std::vector<Point>& points) {
    std::vector<Point> result = PathOptimizer::removeRepeatPoints(points);
    size_t size = 0;
    while (size != result.size()) {
        size = result.size();
        result = PathOptimizer::reducePoints(result);
    }
    return result;
}

}  // namespace PathEditor

}  // namespace orthoedge
