/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathfindingStrategy.hpp"
#include <cmath>

namespace HordeMind {

DirectStrategy::DirectStrategy(float spacing)
    : m_spacing(spacing > 0.0f ? spacing : DEFAULT_SPACING) {}

std::vector<Vector2D> DirectStrategy::findPath(const Vector2D& start, const Vector2D& goal) {
    return interpolate(start, goal, m_spacing);
}

std::vector<Vector2D> DirectStrategy::interpolate(const Vector2D& start, const Vector2D& goal, float spacing) {
    if (!(spacing > 0.0f)) {
        spacing = DEFAULT_SPACING;
    }
    const float dist = Vector2D::distance(start, goal);
    if (!std::isfinite(dist)) {
        return {goal};
    }
    const int steps = static_cast<int>(std::ceil(dist / spacing));
    if (steps <= 0) {
        return {goal};
    }

    std::vector<Vector2D> path;
    path.reserve(static_cast<size_t>(steps) + 1);
    for (int i = 0; i <= steps; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(steps);
        path.push_back(Vector2D::lerp(start, goal, t));
    }
    // Keep the endpoint exact regardless of float rounding in lerp
    path.back() = goal;
    return path;
}

} // namespace HordeMind
