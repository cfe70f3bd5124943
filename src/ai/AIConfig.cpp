/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/AIConfig.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace HordeMind
{

namespace {

bool positiveFinite(float value) {
    return std::isfinite(value) && value > 0.0f;
}

template <typename T>
void clampPositive(T& value, T fallback, const char* name) {
    bool valid;
    if constexpr (std::is_floating_point_v<T>) {
        valid = positiveFinite(value);
    } else {
        valid = value > 0;
    }
    if (!valid) {
        AI_WARN(std::string("AIConfig: invalid ") + name + ", using default");
        value = fallback;
    }
}

void requirePositive(bool ok, const char* name, const std::string& value) {
    if (!ok) {
        throw std::invalid_argument(std::string("AIConfig ") + name +
                                    " must be positive: " + value);
    }
}

} // namespace

AIConfig AIConfig::sanitized() const
{
    const AIConfig defaults{};
    AIConfig out = *this;

    clampPositive(out.maxAgentUpdatesPerTick, defaults.maxAgentUpdatesPerTick, "maxAgentUpdatesPerTick");
    clampPositive(out.maxPathfindsPerTick, defaults.maxPathfindsPerTick, "maxPathfindsPerTick");
    clampPositive(out.flowFieldResolution, defaults.flowFieldResolution, "flowFieldResolution");
    clampPositive(out.avoidanceRadius, defaults.avoidanceRadius, "avoidanceRadius");
    clampPositive(out.spatialCellSize, defaults.spatialCellSize, "spatialCellSize");
    clampPositive(out.aStarCellSize, defaults.aStarCellSize, "aStarCellSize");
    clampPositive(out.maxSearchNodes, defaults.maxSearchNodes, "maxSearchNodes");
    clampPositive(out.maxPathLength, defaults.maxPathLength, "maxPathLength");
    clampPositive(out.pathCacheQuantization, defaults.pathCacheQuantization, "pathCacheQuantization");
    clampPositive(out.pathCacheCapacity, defaults.pathCacheCapacity, "pathCacheCapacity");
    clampPositive(out.flowFieldCapacity, defaults.flowFieldCapacity, "flowFieldCapacity");
    clampPositive(out.maxQueuedRequests, defaults.maxQueuedRequests, "maxQueuedRequests");
    clampPositive(out.cacheMaintenanceIntervalMs, defaults.cacheMaintenanceIntervalMs,
                  "cacheMaintenanceIntervalMs");

    if (!std::isfinite(out.pathfindCooldownMs) || out.pathfindCooldownMs < 0.0f) {
        out.pathfindCooldownMs = defaults.pathfindCooldownMs;
    }

    const bool boundsFinite = std::isfinite(out.worldMin.getX()) && std::isfinite(out.worldMin.getY()) &&
                              std::isfinite(out.worldMax.getX()) && std::isfinite(out.worldMax.getY());
    if (!boundsFinite || out.worldMax.getX() <= out.worldMin.getX() ||
        out.worldMax.getY() <= out.worldMin.getY()) {
        AI_WARN("AIConfig: invalid world bounds, using defaults");
        out.worldMin = defaults.worldMin;
        out.worldMax = defaults.worldMax;
    }
    return out;
}

void AIConfig::validate() const
{
    requirePositive(positiveFinite(spatialCellSize), "spatialCellSize", std::to_string(spatialCellSize));
    requirePositive(positiveFinite(flowFieldResolution), "flowFieldResolution",
                    std::to_string(flowFieldResolution));
    requirePositive(positiveFinite(aStarCellSize), "aStarCellSize", std::to_string(aStarCellSize));
    requirePositive(maxAgentUpdatesPerTick > 0, "maxAgentUpdatesPerTick",
                    std::to_string(maxAgentUpdatesPerTick));
    requirePositive(maxPathfindsPerTick > 0, "maxPathfindsPerTick", std::to_string(maxPathfindsPerTick));
}

} // namespace HordeMind
