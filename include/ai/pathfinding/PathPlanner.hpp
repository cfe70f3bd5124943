/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_PLANNER_HPP
#define PATH_PLANNER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "ai/internal/PathCache.hpp"
#include "ai/pathfinding/PathfindingStrategy.hpp"

namespace HordeMind {

/**
 * @brief Cache-first front end for the active pathfinding strategy.
 *
 * A hit on the quantized (start, goal) pair returns the stored waypoints
 * without calling the strategy; a miss computes and stores. Only paths that
 * end at their goal are stored.
 */
class PathPlanner {
public:
    /**
     * @throws std::invalid_argument if strategy is null
     */
    PathPlanner(std::unique_ptr<IPathfindingStrategy> strategy, AIInternal::PathCache& cache);

    std::vector<Vector2D> plan(const Vector2D& start, const Vector2D& goal);

    /**
     * @throws std::invalid_argument if strategy is null
     */
    void setStrategy(std::unique_ptr<IPathfindingStrategy> strategy);

    IPathfindingStrategy& getStrategy() { return *m_strategy; }
    PathfindingAlgorithm getAlgorithm() const { return m_strategy->getAlgorithm(); }

    uint64_t getPathsComputed() const { return m_pathsComputed; }
    uint64_t getCacheHits() const { return m_cacheHits; }

private:
    std::unique_ptr<IPathfindingStrategy> m_strategy;
    AIInternal::PathCache& m_cache;
    uint64_t m_pathsComputed{0};
    uint64_t m_cacheHits{0};
};

} // namespace HordeMind

#endif // PATH_PLANNER_HPP
