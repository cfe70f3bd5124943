/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/FlowFieldStrategy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace HordeMind {

FlowFieldStrategy::FlowFieldStrategy(AIInternal::FlowFieldCache& cache, const FlowFieldSettings& settings,
                                     const NavigationGrid* obstacles)
    : m_cache(cache), m_settings(settings), m_obstacles(obstacles) {
    if (!(m_settings.resolution > 0.0f)) {
        m_settings.resolution = FlowFieldSettings{}.resolution;
    }
    if (m_settings.maxPathLength <= 0) {
        m_settings.maxPathLength = FlowFieldSettings{}.maxPathLength;
    }
}

uint64_t FlowFieldStrategy::keyFor(const Vector2D& goal) const {
    const double res = m_settings.resolution;
    auto cell = [res](float coord, float origin) {
        const double c = std::floor((static_cast<double>(coord) - origin) / res);
        return static_cast<int>(std::clamp(c, -2147483000.0, 2147483000.0));
    };
    return AIInternal::FlowFieldCache::makeKey(cell(goal.getX(), m_settings.worldMin.getX()),
                                               cell(goal.getY(), m_settings.worldMin.getY()));
}

std::shared_ptr<const FlowField> FlowFieldStrategy::fieldFor(const Vector2D& goal) {
    const uint64_t key = keyFor(goal);
    if (auto cached = m_cache.find(key)) {
        return cached;
    }
    auto field = std::make_shared<const FlowField>(
        FlowField::build(goal, m_settings.worldMin, m_settings.worldMax, m_settings.resolution, m_obstacles));
    m_cache.store(key, field);
    return field;
}

std::vector<Vector2D> FlowFieldStrategy::findPath(const Vector2D& start, const Vector2D& goal) {
    if (!std::isfinite(goal.getX()) || !std::isfinite(goal.getY())) {
        return DirectStrategy::interpolate(start, goal);
    }

    const auto field = fieldFor(goal);
    const FlowFieldCell* startCell = field->cellAtWorld(start);
    if (startCell == nullptr || startCell->cost == FlowField::UNREACHABLE) {
        PATHFIND_DEBUG("Start outside flow field or unreachable, using direct path");
        return DirectStrategy::interpolate(start, goal);
    }

    if (Vector2D::distance(start, goal) < m_settings.resolution) {
        return {goal};
    }

    // Walk cell centre to cell centre along the stored neighbour links. The
    // first waypoint snaps the agent onto the centre of its own cell.
    const auto [goalX, goalY] = field->getGoalCell();
    auto [cx, cy] = field->worldToCell(start);
    if (cx == goalX && cy == goalY) {
        return {goal};
    }

    std::vector<Vector2D> path;
    path.reserve(static_cast<size_t>(m_settings.maxPathLength) + 2);
    path.push_back(field->cellCenter(cx, cy));

    bool arrived = false;
    for (int i = 0; i < m_settings.maxPathLength; ++i) {
        const FlowFieldCell* cell = field->cellAt(cx, cy);
        if (cell == nullptr || cell->nextX < 0) {
            break;
        }
        cx = cell->nextX;
        cy = cell->nextY;
        if (cx == goalX && cy == goalY) {
            arrived = true;
            break;
        }
        path.push_back(field->cellCenter(cx, cy));
    }

    if (!arrived) {
        PATHFIND_DEBUG("Flow field walk did not reach the goal cell, using direct path");
        return DirectStrategy::interpolate(start, goal);
    }
    path.push_back(goal);
    return path;
}

} // namespace HordeMind
