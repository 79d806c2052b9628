#include "orthoedge/interactive/SegmentDragController.h"
#include "orthoedge/common/Logger.h"
#include "orthoedge/core/IdGenerator.h"

#include <utility>

namespace orthoedge {

SegmentDragController::SegmentDragController(std::shared_ptr<ICoordinateTransform> transform)
    : transform_(std::move(transform)) {
    if (!transform_) {
        transform_ = std::make_shared<ViewportTransform>();
    }
}

void SegmentDragController::setTransform(std::shared_ptr<ICoordinateTransform> transform) {
    if (!transform) {
        LOG_WARN("null transform ignored");
        return;
    }
    transform_ = std::move(transform);
}

SegmentDragController::DragStartResult SegmentDragController::startDrag(
    const SegmentChain& chain, size_t chainIndex) {

    DragStartResult result;

    if (state_) {
        result.reason = "drag " + state_->dragId + " is still active";
        LOG_WARN("rejecting drag of segment {}: {}", chainIndex, result.reason);
        return result;
    }

    const Segment* segment = chain.at(chainIndex);
    if (!segment) {
        result.reason = "segment index out of range";
        LOG_WARN("rejecting drag of segment {} (chain has {})", chainIndex, chain.size());
        return result;
    }

    if (!segment->draggable) {
        result.reason = "segment is not draggable";
        LOG_WARN("rejecting drag of segment {}: {}", chainIndex, result.reason);
        return result;
    }

    DragState state;
    state.dragId = ids::nextDragId();
    state.draggedSegmentId = segment->id;
    state.chainIndex = chainIndex;
    state.orientation = segment->orientation();
    state.originalFrom = {segment->start, segment->end};
    state.currentTo = state.originalFrom;
    state_ = std::move(state);

    LOG_DEBUG("{} started on segment {} ({})", state_->dragId, chainIndex,
              segment->isHorizontal() ? "horizontal" : "vertical");

    result.success = true;
    result.dragId = state_->dragId;
    return result;
}

Point SegmentDragController::diagramDelta(const Point& screenPosition,
                                          const Point& screenDelta) const {
    Point before = transform_->toDiagram(screenPosition - screenDelta);
    Point after = transform_->toDiagram(screenPosition);
    return after - before;
}

std::optional<SegmentDragEvent> SegmentDragController::updateDrag(
    const Point& screenPosition, const Point& screenDelta) {

    if (!state_) {
        return std::nullopt;
    }

    Point delta = diagramDelta(screenPosition, screenDelta);

    SegmentDragEvent event;
    event.dragId = state_->dragId;
    event.from = state_->currentTo;
    event.to = state_->currentTo;

    if (state_->orientation == SegmentOrientation::Horizontal) {
        event.to.start.y += delta.y;
        event.to.end.y += delta.y;
    } else {
        event.to.start.x += delta.x;
        event.to.end.x += delta.x;
    }

    state_->currentTo = event.to;

    LOG_TRACE("{} moved by ({}, {})", event.dragId, delta.x, delta.y);

    if (listener_) {
        listener_(event);
    }
    return event;
}

std::optional<DragState> SegmentDragController::endDrag() {
    if (!state_) {
        return std::nullopt;
    }
    LOG_DEBUG("{} ended", state_->dragId);
    return std::exchange(state_, std::nullopt);
}

std::optional<DragState> SegmentDragController::cancelDrag() {
    if (!state_) {
        return std::nullopt;
    }
    LOG_DEBUG("{} cancelled", state_->dragId);
    return std::exchange(state_, std::nullopt);
}

bool SegmentDragController::isDraggingSegment(const Segment& segment) const {
    return state_ && state_->currentTo.start == segment.start;
}

}  // namespace orthoedge
