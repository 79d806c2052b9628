#pragma once

#include "orthoedge/core/Types.h"

namespace orthoedge {

/// Screen <-> diagram coordinate mapping supplied by the host.
/// OrthoEdge never reads viewport or camera state on its own.
class ICoordinateTransform {
public:
    virtual ~ICoordinateTransform() = default;

    virtual Point toDiagram(const Point& screen) const = 0;
    virtual Point toScreen(const Point& diagram) const = 0;
};

/// Pan/zoom view: screen = (diagram + panOffset) * zoom + screenOffset
class ViewportTransform : public ICoordinateTransform {
public:
    ViewportTransform() = default;
    ViewportTransform(Point panOffset, float zoom, Point screenOffset = {0.0f, 0.0f});

    Point toDiagram(const Point& screen) const override;
    Point toScreen(const Point& diagram) const override;

    void setPanOffset(const Point& panOffset) { panOffset_ = panOffset; }
    /// Non-positive zoom is ignored
    void setZoom(float zoom);
    void setScreenOffset(const Point& screenOffset) { screenOffset_ = screenOffset; }

    const Point& panOffset() const { return panOffset_; }
    float zoom() const { return zoom_; }
    const Point& screenOffset() const { return screenOffset_; }

private:
    Point panOffset_{0.0f, 0.0f};
    float zoom_ = 1.0f;
    Point screenOffset_{0.0f, 0.0f};
};

}  // namespace orthoedge
