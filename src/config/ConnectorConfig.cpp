#include "orthoedge/config/ConnectorConfig.h"
#include "orthoedge/common/Logger.h"

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace orthoedge {

namespace {

bool isUsable(float value) {
    return std::isfinite(value) && value > 0.0f;
}

void readFloat(const json& j, const char* key, float& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<float>();
    }
}

}  // namespace

bool ConnectorConfig::validate() {
    const ConnectorConfig defaults;
    bool changed = false;

    if (!isUsable(mergeThreshold)) {
        LOG_WARN("mergeThreshold {} is not positive, using {}", mergeThreshold, defaults.mergeThreshold);
        mergeThreshold = defaults.mergeThreshold;
        changed = true;
    }
    if (!std::isfinite(anchorOffset) || anchorOffset < 0.0f) {
        LOG_WARN("anchorOffset {} is invalid, using {}", anchorOffset, defaults.anchorOffset);
        anchorOffset = defaults.anchorOffset;
        changed = true;
    }
    if (!std::isfinite(obstacleMargin) || obstacleMargin < 0.0f) {
        LOG_WARN("obstacleMargin {} is invalid, using {}", obstacleMargin, defaults.obstacleMargin);
        obstacleMargin = defaults.obstacleMargin;
        changed = true;
    }
    if (!isUsable(handlerWidth)) {
        LOG_WARN("handlerWidth {} is not positive, using {}", handlerWidth, defaults.handlerWidth);
        handlerWidth = defaults.handlerWidth;
        changed = true;
    }
    if (!isUsable(handlerThickness)) {
        LOG_WARN("handlerThickness {} is not positive, using {}", handlerThickness, defaults.handlerThickness);
        handlerThickness = defaults.handlerThickness;
        changed = true;
    }

    return changed;
}

std::string ConnectorConfigSerializer::toJson(const ConnectorConfig& config) {
    json j;
    j["mergeThreshold"] = config.mergeThreshold;
    j["reduceCollinear"] = config.reduceCollinear;
    j["anchorOffset"] = config.anchorOffset;
    j["obstacleMargin"] = config.obstacleMargin;
    j["handle"] = {
        {"width", config.handlerWidth},
        {"thickness", config.handlerThickness}
    };
    return j.dump(2);
}

std::optional<ConnectorConfig> ConnectorConfigSerializer::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        LOG_ERROR("invalid connector config: {}", e.what());
        return std::nullopt;
    }

    if (!j.is_object()) {
        LOG_ERROR("connector config must be a JSON object");
        return std::nullopt;
    }

    ConnectorConfig config;
    readFloat(j, "mergeThreshold", config.mergeThreshold);
    readFloat(j, "anchorOffset", config.anchorOffset);
    readFloat(j, "obstacleMargin", config.obstacleMargin);

    if (j.contains("reduceCollinear") && j["reduceCollinear"].is_boolean()) {
        config.reduceCollinear = j["reduceCollinear"].get<bool>();
    }

    if (j.contains("handle") && j["handle"].is_object()) {
        const auto& handle = j["handle"];
        readFloat(handle, "width", config.handlerWidth);
        readFloat(handle, "thickness", config.handlerThickness);
    }

    config.validate();
    return config;
}

bool ConnectorConfigSerializer::saveToFile(const ConnectorConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("cannot open {} for writing", path);
        return false;
    }
    file << toJson(config);
    return static_cast<bool>(file);
}

std::optional<ConnectorConfig> ConnectorConfigSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("cannot open {} for reading", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace orthoedge
