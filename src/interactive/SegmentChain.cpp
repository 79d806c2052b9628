#include "orthoedge/interactive/SegmentChain.h"
#include "orthoedge/common/Logger.h"
#include "orthoedge/core/GeometryUtils.h"

#include <algorithm>

namespace orthoedge {

namespace {

/// False when two consecutive segments run along the same line; sliding one
/// of them would tilt the other
bool turnsAt(const Segment& a, const Segment& b) {
    return a.isDegenerate() || b.isDegenerate() || a.orientation() != b.orientation();
}

}  // namespace

Point Segment::center() const {
    return geometry::lineCenter(start, end);
}

Rect Segment::handleRect(float handlerWidth, float handlerThickness) const {
    Point c = center();
    float w = isHorizontal() ? handlerWidth : handlerThickness;
    float h = isHorizontal() ? handlerThickness : handlerWidth;
    return {c.x - w / 2, c.y - h / 2, w, h};
}

SegmentChain::SegmentChain(const std::vector<Point>& points) {
    if (points.size() < 2) {
        return;
    }

    const size_t count = points.size() - 1;
    segments_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Segment segment;
        segment.chainIndex = i;
        segment.start = points[i];
        segment.end = points[i + 1];
        segment.id = segment.start.id.empty() ? "segment-" + std::to_string(i) : segment.start.id;
        segments_.push_back(std::move(segment));
    }

    // The first and last segments touch the anchors, which never move
    for (size_t i = 1; i + 1 < count; ++i) {
        Segment& segment = segments_[i];
        segment.draggable = !segment.isDegenerate() && segment.isOrthogonal() &&
                            turnsAt(segments_[i - 1], segment) &&
                            turnsAt(segment, segments_[i + 1]);
    }

    LOG_TRACE("built chain with {} segments, {} draggable",
              segments_.size(), draggableSegments().size());
}

const Segment* SegmentChain::at(size_t index) const {
    return index < segments_.size() ? &segments_[index] : nullptr;
}

const Segment* SegmentChain::previousPartner(size_t index) const {
    return index >= 2 ? at(index - 2) : nullptr;
}

const Segment* SegmentChain::nextPartner(size_t index) const {
    return index < segments_.size() ? at(index + 2) : nullptr;
}

bool SegmentChain::isOnPartnerLine(size_t index) const {
    const Segment* segment = at(index);
    if (!segment || segment->isDegenerate()) {
        return false;
    }

    for (const Segment* partner : {previousPartner(index), nextPartner(index)}) {
        if (!partner || partner->isDegenerate() || partner->orientation() != segment->orientation()) {
            continue;
        }
        bool sameLine = segment->isHorizontal() ? segment->start.y == partner->start.y
                                                : segment->start.x == partner->start.x;
        if (sameLine) {
            return true;
        }
    }
    return false;
}

std::vector<const Segment*> SegmentChain::draggableSegments() const {
    std::vector<const Segment*> result;
    for (const auto& segment : segments_) {
        if (segment.draggable) {
            result.push_back(&segment);
        }
    }
    return result;
}

const Segment* SegmentChain::findById(const std::string& segmentId) const {
    auto it = std::find_if(segments_.begin(), segments_.end(),
        [&](const Segment& s) { return s.id == segmentId; });
    return it != segments_.end() ? &(*it) : nullptr;
}

}  // namespace orthoedge
