/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_STRATEGY_HPP
#define PATHFINDING_STRATEGY_HPP

#include <vector>
#include "ai/pathfinding/PathfindingAlgorithm.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

/**
 * @brief One pathfinding algorithm behind a common waypoint-list interface.
 *
 * Implementations never fail outward: when they cannot produce a route they
 * return the Direct interpolation instead, so the result is never empty.
 */
class IPathfindingStrategy {
public:
    virtual ~IPathfindingStrategy() = default;

    virtual std::vector<Vector2D> findPath(const Vector2D& start, const Vector2D& goal) = 0;

    virtual PathfindingAlgorithm getAlgorithm() const = 0;
};

/**
 * @brief Straight-line interpolation, one waypoint every `spacing` units.
 *
 * Ignores obstacles. Also the fallback used by every other strategy.
 */
class DirectStrategy : public IPathfindingStrategy {
public:
    static constexpr float DEFAULT_SPACING = 50.0f;

    explicit DirectStrategy(float spacing = DEFAULT_SPACING);

    std::vector<Vector2D> findPath(const Vector2D& start, const Vector2D& goal) override;
    PathfindingAlgorithm getAlgorithm() const override { return PathfindingAlgorithm::Direct; }

    static std::vector<Vector2D> interpolate(const Vector2D& start, const Vector2D& goal,
                                             float spacing = DEFAULT_SPACING);

private:
    float m_spacing;
};

} // namespace HordeMind

#endif // PATHFINDING_STRATEGY_HPP
