/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOW_FIELD_STRATEGY_HPP
#define FLOW_FIELD_STRATEGY_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "ai/internal/FlowFieldCache.hpp"
#include "ai/pathfinding/FlowField.hpp"
#include "ai/pathfinding/PathfindingStrategy.hpp"

namespace HordeMind {

class NavigationGrid;

struct FlowFieldSettings {
    Vector2D worldMin{0.0f, 0.0f};
    Vector2D worldMax{1000.0f, 1000.0f};
    float resolution = 32.0f;   // Cell size; also the step length when reading a path
    int maxPathLength = 50;     // Maximum steps taken when reading a path
};

/**
 * @brief Reads paths out of shared per-goal flow fields.
 *
 * Fields are looked up in (and added to) the cache passed at construction, so
 * every agent heading for the same goal cell reuses one field.
 */
class FlowFieldStrategy : public IPathfindingStrategy {
public:
    FlowFieldStrategy(AIInternal::FlowFieldCache& cache, const FlowFieldSettings& settings,
                      const NavigationGrid* obstacles = nullptr);

    std::vector<Vector2D> findPath(const Vector2D& start, const Vector2D& goal) override;
    PathfindingAlgorithm getAlgorithm() const override { return PathfindingAlgorithm::FlowField; }

    /**
     * @brief Cached field for the goal's cell, built on a miss.
     */
    std::shared_ptr<const FlowField> fieldFor(const Vector2D& goal);

    /**
     * @brief Cache key of the cell containing the goal.
     */
    uint64_t keyFor(const Vector2D& goal) const;

    const FlowFieldSettings& getSettings() const { return m_settings; }

private:
    AIInternal::FlowFieldCache& m_cache;
    FlowFieldSettings m_settings;
    const NavigationGrid* m_obstacles;
};

} // namespace HordeMind

#endif // FLOW_FIELD_STRATEGY_HPP
