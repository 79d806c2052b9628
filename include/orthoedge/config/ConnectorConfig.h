#pragma once

#include "orthoedge/core/GeometryUtils.h"

#include <optional>
#include <string>

namespace orthoedge {

/// Tunables for connector cleanup, validation and drag handles.
///
/// Example usage:
/// @code
/// auto config = ConnectorConfigSerializer::loadFromFile("connector.json")
///                   .value_or(ConnectorConfig{});
/// PathOptimizer optimizer(config);
/// @endcode
struct ConnectorConfig {
    /// Coordinates closer than this (per axis) collapse onto one value
    float mergeThreshold = constants::DEFAULT_MERGE_THRESHOLD;

    /// Drop interior points lying on the straight run between their neighbours
    bool reduceCollinear = true;

    /// Distance from an anchor to its offset point
    float anchorOffset = constants::DEFAULT_ANCHOR_OFFSET;

    /// Clearance added around obstacles before segment checks
    float obstacleMargin = constants::DEFAULT_OBSTACLE_MARGIN;

    /// Drag handle length along the segment
    float handlerWidth = 20.0f;

    /// Drag handle size across the segment
    float handlerThickness = 6.0f;

    /// Replace out-of-range values with defaults.
    /// @return true if anything was changed
    bool validate();

    bool operator==(const ConnectorConfig& o) const = default;
};

/// JSON (de)serialization of ConnectorConfig.
/// Unknown keys are ignored and missing keys keep their defaults.
class ConnectorConfigSerializer {
public:
    static std::string toJson(const ConnectorConfig& config);

    /// @return std::nullopt if the text is not a JSON object
    static std::optional<ConnectorConfig> fromJson(const std::string& json);

    /// @return true if the file was written
    static bool saveToFile(const ConnectorConfig& config, const std::string& path);

    /// @return std::nullopt if the file cannot be read or parsed
    static std::optional<ConnectorConfig> loadFromFile(const std::string& path);
};

}  // namespace orthoedge
