#include "orthoedge/path/PathOptimizer.h"
#include "orthoedge/common/Logger.h"
#include "orthoedge/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace orthoedge {

namespace {

/// Representative values already handed out on one axis
class AxisClusters {
public:
    explicit AxisClusters(float threshold) : threshold_(threshold) {}

    float snap(float value) {
        value = std::floor(value);
        auto it = std::find_if(values_.begin(), values_.end(),
            [&](float rep) { return std::abs(value - rep) < threshold_; });
        if (it != values_.end()) {
            return *it;
        }
        values_.push_back(value);
        return value;
    }

private:
    float threshold_;
    std::vector<float> values_;
};

}  // namespace

std::vector<Point> OptimizedPath::allPoints() const {
    std::vector<Point> points;
    points.reserve(interiorPoints.size() + 2);
    points.push_back(source);
    points.insert(points.end(), interiorPoints.begin(), interiorPoints.end());
    points.push_back(target);
    return points;
}

PathOptimizer::PathOptimizer(const ConnectorConfig& config)
    : config_(config) {
    config_.validate();
}

OptimizedPath PathOptimizer::optimize(const OptimizeRequest& request) const {
    std::vector<Point> points;
    points.reserve(request.rawPoints.size() + 4);
    points.push_back(request.source.point);
    points.push_back(request.sourceOffset);
    points.insert(points.end(), request.rawPoints.begin(), request.rawPoints.end());
    points.push_back(request.targetOffset);
    points.push_back(request.target.point);

    std::vector<Point> merged = mergeClosePoints(points, config_.mergeThreshold);

    OptimizedPath result;
    result.source = merged.front();
    result.target = merged.back();
    std::vector<Point> edgePoints(merged.begin() + 1, merged.end() - 1);
    result.sourceOffset = edgePoints.front();
    result.targetOffset = edgePoints.back();

    // Merging must never detach the path from its anchors
    if (isHorizontal(request.source.side)) {
        result.source.x = request.source.point.x;
    } else {
        result.source.y = request.source.point.y;
    }
    if (isHorizontal(request.target.side)) {
        result.target.x = request.target.point.x;
    } else {
        result.target.y = request.target.point.y;
    }

    size_t before = edgePoints.size();
    edgePoints = removeRepeatPoints(edgePoints);
    size_t afterDedupe = edgePoints.size();

    if (config_.reduceCollinear) {
        // Whole path: an offset on the run from its anchor is redundant too
        std::vector<Point> full;
        full.reserve(edgePoints.size() + 2);
        full.push_back(result.source);
        full.insert(full.end(), edgePoints.begin(), edgePoints.end());
        full.push_back(result.target);

        size_t size = 0;
        while (size != full.size()) {
            size = full.size();
            full = reducePoints(full);
        }
        edgePoints.assign(full.begin() + 1, full.end() - 1);
    }

    for (size_t i = 0; i < edgePoints.size(); ++i) {
        edgePoints[i].id = std::to_string(i + 1);
    }

    LOG_DEBUG("{} -> {} points ({} repeated, {} collinear)",
              before, edgePoints.size(), before - afterDedupe, afterDedupe - edgePoints.size());

    result.interiorPoints = std::move(edgePoints);
    return result;
}

std::vector<Point> PathOptimizer::mergeClosePoints(const std::vector<Point>& points, float threshold) {
    AxisClusters xs(threshold);
    AxisClusters ys(threshold);

    std::vector<Point> merged;
    merged.reserve(points.size());
    for (const auto& p : points) {
        Point snapped = p;
        snapped.x = xs.snap(p.x);
        snapped.y = ys.snap(p.y);
        merged.push_back(std::move(snapped));
    }
    return merged;
}

std::vector<Point> PathOptimizer::removeRepeatPoints(const std::vector<Point>& points) {
    if (points.empty()) {
        return {};
    }

    const Point& last = points.back();
    std::set<std::pair<float, float>> seen = {{last.x, last.y}};

    std::vector<Point> unique;
    unique.reserve(points.size());
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const Point& p = points[i];
        bool fresh = seen.insert({p.x, p.y}).second;
        if (fresh || i == 0) {
            unique.push_back(p);
        }
    }
    unique.push_back(last);
    return unique;
}

std::vector<Point> PathOptimizer::reducePoints(const std::vector<Point>& points) {
    if (points.size() < 3) {
        return points;
    }

    std::vector<Point> reduced = {points.front()};
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        if (!geometry::isInLine(points[i], points[i - 1], points[i + 1])) {
            reduced.push_back(points[i]);
        }
    }
    reduced.push_back(points.back());
    return reduced;
}

}  // namespace orthoedge
