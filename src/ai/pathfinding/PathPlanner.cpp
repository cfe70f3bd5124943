/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathPlanner.hpp"
#include "core/Logger.hpp"
#include <stdexcept>
#include <string>

namespace HordeMind {

PathPlanner::PathPlanner(std::unique_ptr<IPathfindingStrategy> strategy, AIInternal::PathCache& cache)
    : m_strategy(std::move(strategy)), m_cache(cache) {
    if (!m_strategy) {
        throw std::invalid_argument("PathPlanner requires a strategy");
    }
}

void PathPlanner::setStrategy(std::unique_ptr<IPathfindingStrategy> strategy) {
    if (!strategy) {
        throw std::invalid_argument("PathPlanner requires a strategy");
    }
    m_strategy = std::move(strategy);
    PATHFIND_INFO(std::string("Strategy set to ") + algorithmToString(m_strategy->getAlgorithm()));
}

std::vector<Vector2D> PathPlanner::plan(const Vector2D& start, const Vector2D& goal) {
    if (auto cached = m_cache.find(start, goal)) {
        ++m_cacheHits;
        return std::move(*cached);
    }

    std::vector<Vector2D> path = m_strategy->findPath(start, goal);
    ++m_pathsComputed;
    if (!path.empty() && path.back() == goal) {
        m_cache.store(start, goal, path);
    } else {
        PATHFIND_DEBUG("Path does not end at its goal, not cached");
    }
    return path;
}

} // namespace HordeMind
