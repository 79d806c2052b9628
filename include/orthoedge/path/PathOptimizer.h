#pragma once

#include "orthoedge/config/ConnectorConfig.h"
#include "orthoedge/core/Types.h"

#include <vector>

namespace orthoedge {

/// Input of PathOptimizer::optimize
struct OptimizeRequest {
    std::vector<Point> rawPoints;   ///< Waypoints between the two offsets, as proposed by a pathfinder
    AnchorPoint source;
    AnchorPoint target;
    Point sourceOffset;             ///< Point just outside the source anchor
    Point targetOffset;             ///< Point just outside the target anchor
};

/// Cleaned connector path
struct OptimizedPath {
    Point source;
    Point target;
    Point sourceOffset;             ///< Merged source offset (before duplicate removal)
    Point targetOffset;             ///< Merged target offset (before duplicate removal)

    /// Everything between source and target. Starts at the source offset and
    /// ends at the target offset unless collinear reduction dropped them
    /// (an offset on the straight run from its anchor). Ids are "1", "2", ...
    /// by position.
    std::vector<Point> interiorPoints;

    /// [source, ...interiorPoints, target]
    std::vector<Point> allPoints() const;
};

/// Turns a raw waypoint list into a minimal orthogonal polyline.
///
/// Passes, in order:
///  1. merge near-equal coordinates (floor, then first-seen clustering per axis)
///  2. restore the exact anchor coordinate on each endpoint
///  3. remove repeated points (first and last always kept)
///  4. drop points lying on the run between their neighbours, over the whole
///     path from source to target, until none is left
///
/// Every pass is total: no input makes the optimizer fail.
class PathOptimizer {
public:
    PathOptimizer() = default;
    explicit PathOptimizer(const ConnectorConfig& config);

    OptimizedPath optimize(const OptimizeRequest& request) const;

    const ConnectorConfig& config() const { return config_; }

    /// Floor every coordinate and snap it onto the first previously seen value
    /// of the same axis that is closer than threshold. Order-sensitive: the
    /// first point reaching a neighbourhood defines its value.
    static std::vector<Point> mergeClosePoints(const std::vector<Point>& points,
                                               float threshold = constants::DEFAULT_MERGE_THRESHOLD);

    /// Remove points whose coordinate repeats.
    /// First and last are always kept. The last point's coordinate counts as
    /// already seen, so interior copies of it are dropped; for any other
    /// coordinate the first occurrence survives.
    static std::vector<Point> removeRepeatPoints(const std::vector<Point>& points);

    /// Keep first and last, drop every interior point that lies on the
    /// axis-aligned segment between its immediate neighbours.
    static std::vector<Point> reducePoints(const std::vector<Point>& points);

private:
    ConnectorConfig config_;
};

}  // namespace orthoedge
