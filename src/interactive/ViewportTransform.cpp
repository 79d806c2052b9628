#include "orthoedge/interactive/ICoordinateTransform.h"
#include "orthoedge/common/Logger.h"

#include <utility>

namespace orthoedge {

ViewportTransform::ViewportTransform(Point panOffset, float zoom, Point screenOffset)
    : panOffset_(std::move(panOffset)), screenOffset_(std::move(screenOffset)) {
    setZoom(zoom);
}

void ViewportTransform::setZoom(float zoom) {
    if (zoom <= 0.0f) {
        LOG_WARN("ignoring zoom {}", zoom);
        return;
    }
    zoom_ = zoom;
}

Point ViewportTransform::toDiagram(const Point& screen) const {
    return {(screen.x - screenOffset_.x) / zoom_ - panOffset_.x,
            (screen.y - screenOffset_.y) / zoom_ - panOffset_.y};
}

Point ViewportTransform::toScreen(const Point& diagram) const {
    return {(diagram.x + panOffset_.x) * zoom_ + screenOffset_.x,
            (diagram.y + panOffset_.y) * zoom_ + screenOffset_.y};
}

}  // namespace orthoedge
