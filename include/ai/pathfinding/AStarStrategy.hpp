/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ASTAR_STRATEGY_HPP
#define ASTAR_STRATEGY_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "ai/pathfinding/PathfindingStrategy.hpp"

namespace HordeMind {

class NavigationGrid;

struct GridSearchSettings {
    float cellSize = 20.0f;          // Lattice spacing in world units
    size_t maxSearchNodes = 4000;    // Closed set size that aborts the search
    float heuristicWeight = 1.0f;    // 0 turns the search into uniform-cost
};

/**
 * @brief Outcome of the most recent search, kept for tests and diagnostics.
 */
struct GridSearchStats {
    size_t nodesExpanded{0};
    bool usedFallback{false};
};

/**
 * @brief A* over an unbounded 8-connected lattice anchored at the start point.
 *
 * Priority is g + w*h with h the straight-line distance in cells. Diagonal
 * steps between two blocked orthogonal neighbours are not taken. The search
 * ends at the first expanded node within one cell of the goal; the exact goal
 * is then appended. Exceeding maxSearchNodes or exhausting the open set falls
 * back to DirectStrategy::interpolate().
 */
class AStarStrategy : public IPathfindingStrategy {
public:
    /**
     * @param obstacles Optional static obstacle layer; must outlive the strategy
     */
    explicit AStarStrategy(const GridSearchSettings& settings = GridSearchSettings{},
                           const NavigationGrid* obstacles = nullptr);

    std::vector<Vector2D> findPath(const Vector2D& start, const Vector2D& goal) override;
    PathfindingAlgorithm getAlgorithm() const override { return PathfindingAlgorithm::AStar; }

    const GridSearchStats& getLastSearchStats() const { return m_lastStats; }
    const GridSearchSettings& getSettings() const { return m_settings; }

protected:
    GridSearchSettings m_settings;

private:
    const NavigationGrid* m_obstacles;
    GridSearchStats m_lastStats{};
};

/**
 * @brief Uniform-cost search on the same lattice (A* with a zero heuristic).
 *
 * Returns a shortest path under the lattice quantization at the price of a
 * wider search; the same node limit and fallback apply.
 */
class DijkstraStrategy : public AStarStrategy {
public:
    explicit DijkstraStrategy(const GridSearchSettings& settings = GridSearchSettings{},
                              const NavigationGrid* obstacles = nullptr);

    PathfindingAlgorithm getAlgorithm() const override { return PathfindingAlgorithm::Dijkstra; }
};

} // namespace HordeMind

#endif // ASTAR_STRATEGY_HPP
