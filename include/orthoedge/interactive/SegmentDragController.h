#pragma once

#include "orthoedge/core/Types.h"
#include "orthoedge/interactive/ICoordinateTransform.h"
#include "orthoedge/interactive/SegmentChain.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace orthoedge {

/// Position of a segment's two ends
struct SegmentEnds {
    Point start;
    Point end;
};

/// Emitted once per pointer move while a segment is dragged.
/// The consumer moves the segment from `from` to `to`; the two neighbouring
/// segments share those points and stretch to follow.
struct SegmentDragEvent {
    std::string dragId;
    SegmentEnds from;   ///< Position after the previous move
    SegmentEnds to;     ///< Position after this move
};

/// The single in-progress drag of a controller
struct DragState {
    std::string dragId;
    std::string draggedSegmentId;
    size_t chainIndex = 0;
    SegmentOrientation orientation = SegmentOrientation::Horizontal;
    SegmentEnds originalFrom;   ///< Segment position when the drag started
    SegmentEnds currentTo;      ///< Last position handed to the consumer
};

/// Controller for segment drag gestures.
///
/// Owns the one drag state of an editor: any segment can ask
/// isDraggingSegment() to decide how to highlight itself. A dragged segment
/// only slides perpendicular to itself; horizontal segments follow the
/// pointer's diagram-space dy, vertical ones its dx.
class SegmentDragController {
public:
    /// Result of starting a drag operation
    struct DragStartResult {
        bool success = false;
        std::string reason;
        std::string dragId;
    };

    using DragListener = std::function<void(const SegmentDragEvent&)>;

    explicit SegmentDragController(std::shared_ptr<ICoordinateTransform> transform);

    /// Start dragging segment chainIndex of chain.
    /// Fails for unknown or non-draggable segments and while another drag is
    /// active.
    DragStartResult startDrag(const SegmentChain& chain, size_t chainIndex);

    /// Apply one pointer move.
    /// @param screenPosition Pointer position after the move (screen space)
    /// @param screenDelta Movement since the previous event (screen space)
    /// @return The emitted event, or std::nullopt when no drag is active
    std::optional<SegmentDragEvent> updateDrag(const Point& screenPosition,
                                               const Point& screenDelta);

    /// Finish the drag. The last applied move is final.
    /// @return The state at the end of the gesture, if a drag was active
    std::optional<DragState> endDrag();

    /// Abort the drag (pointer capture lost).
    /// @return The state holding the last applied position, so the consumer
    ///         can restore it
    std::optional<DragState> cancelDrag();

    bool isDragging() const { return state_.has_value(); }

    const std::optional<DragState>& currentState() const { return state_; }

    /// True if segment is the one being dragged.
    /// Matches by start coordinate since segments are rebuilt on every move.
    bool isDraggingSegment(const Segment& segment) const;

    void setDragListener(DragListener listener) { listener_ = std::move(listener); }

    void setTransform(std::shared_ptr<ICoordinateTransform> transform);

private:
    Point diagramDelta(const Point& screenPosition, const Point& screenDelta) const;

    std::shared_ptr<ICoordinateTransform> transform_;
    std::optional<DragState> state_;
    DragListener listener_;
};

}  // namespace orthoedge
