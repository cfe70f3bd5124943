/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AI_CONFIG_HPP
#define AI_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include "ai/pathfinding/PathfindingAlgorithm.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind
{

/**
 * Configuration for AIManager
 *
 * The first block mirrors the options game code usually tunes; the rest are
 * engine limits with sensible defaults.
 */
struct AIConfig
{
    // Commonly tuned
    PathfindingAlgorithm algorithm = PathfindingAlgorithm::FlowField;
    int maxAgentUpdatesPerTick = 50;              // State machine evaluations per tick
    int maxPathfindsPerTick = 10;                 // Queue drain budget per tick
    float flowFieldResolution = 32.0f;            // Flow field cell size (world units)
    float avoidanceRadius = 30.0f;                // Default local avoidance radius
    bool groupBehaviorEnabled = true;             // Swarm flocking for SWARM personalities

    // Spatial index
    float spatialCellSize = 100.0f;               // Spatial grid cell size (world units)
    Vector2D worldMin{0.0f, 0.0f};                // Flow field and k-nearest bounds
    Vector2D worldMax{1000.0f, 1000.0f};

    // Pathfinding
    float aStarCellSize = 20.0f;                  // Lattice spacing for A* and Dijkstra
    int maxSearchNodes = 4000;                    // Closed set limit before falling back to Direct
    int maxPathLength = 50;                       // Max steps when walking a flow field
    float pathfindCooldownMs = 500.0f;            // Minimum ms between path requests per agent
    float pathCacheQuantization = 50.0f;          // Cell size used for path cache keys
    size_t pathCacheCapacity = 100;               // Oldest half evicted beyond this
    size_t flowFieldCapacity = 10;                // Oldest half evicted beyond this
    size_t maxQueuedRequests = 1024;              // Pending pathfinding requests

    // Maintenance
    float cacheMaintenanceIntervalMs = 5000.0f;   // Cache trim and stats event period

    /**
     * @brief Copy with every invalid numeric field replaced by its default.
     */
    AIConfig sanitized() const;

    /**
     * @throws std::invalid_argument on non-positive cell sizes or budgets
     */
    void validate() const;
};

} // namespace HordeMind

#endif // AI_CONFIG_HPP
