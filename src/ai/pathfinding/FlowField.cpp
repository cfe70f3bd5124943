/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/FlowField.hpp"
#include "ai/pathfinding/NavigationGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <string>

namespace HordeMind {

namespace {

constexpr float WAVE_COST_STRAIGHT = 1.0f;
constexpr float WAVE_COST_DIAGONAL = 1.414f;

constexpr int DX8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int DY8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

struct WaveNode {
    float cost;
    int x;
    int y;
};

struct WaveNodeCmp {
    bool operator()(const WaveNode& a, const WaveNode& b) const { return a.cost > b.cost; }
};

} // namespace

FlowField FlowField::build(const Vector2D& goal, const Vector2D& worldMin, const Vector2D& worldMax,
                           float resolution, const NavigationGrid* obstacles) {
    FlowField field;
    field.m_origin = worldMin;
    field.m_goal = goal;
    field.m_resolution = resolution > 0.0f ? resolution : 32.0f;
    field.m_width = std::max(1, static_cast<int>(std::ceil((worldMax.getX() - worldMin.getX()) / field.m_resolution)));
    field.m_height = std::max(1, static_cast<int>(std::ceil((worldMax.getY() - worldMin.getY()) / field.m_resolution)));
    field.m_cells.assign(static_cast<size_t>(field.m_width) * static_cast<size_t>(field.m_height), FlowFieldCell{});

    auto [gx, gy] = field.worldToCell(goal);
    field.m_goalX = gx;
    field.m_goalY = gy;
    if (!field.inBounds(gx, gy)) {
        PATHFIND_DEBUG("Flow field goal outside world bounds, field left unreachable");
        return field;
    }

    auto blocked = [&](int x, int y) {
        return obstacles != nullptr && obstacles->isWorldBlocked(field.cellCenter(x, y));
    };
    // No corner cutting: a diagonal step needs both orthogonal cells open
    auto stepAllowed = [&](int x, int y, int dir) {
        if (dir < 4) {
            return true;
        }
        return !blocked(x + DX8[dir], y) && !blocked(x, y + DY8[dir]);
    };

    // Cost wave: best-cost expansion from the goal cell
    std::priority_queue<WaveNode, std::vector<WaveNode>, WaveNodeCmp> frontier;
    field.m_cells[field.index(gx, gy)].cost = 0.0f;
    frontier.push(WaveNode{0.0f, gx, gy});

    while (!frontier.empty()) {
        const WaveNode node = frontier.top();
        frontier.pop();
        if (node.cost > field.m_cells[field.index(node.x, node.y)].cost) {
            continue;
        }
        for (int dir = 0; dir < 8; ++dir) {
            const int nx = node.x + DX8[dir];
            const int ny = node.y + DY8[dir];
            if (!field.inBounds(nx, ny) || blocked(nx, ny) || !stepAllowed(node.x, node.y, dir)) {
                continue;
            }
            const float next = node.cost + (dir < 4 ? WAVE_COST_STRAIGHT : WAVE_COST_DIAGONAL);
            FlowFieldCell& cell = field.m_cells[field.index(nx, ny)];
            if (next < cell.cost) {
                cell.cost = next;
                frontier.push(WaveNode{next, nx, ny});
            }
        }
    }

    // Steepest descent direction per reachable cell
    for (int y = 0; y < field.m_height; ++y) {
        for (int x = 0; x < field.m_width; ++x) {
            FlowFieldCell& cell = field.m_cells[field.index(x, y)];
            if (cell.cost == UNREACHABLE) {
                continue;
            }
            ++field.m_reachable;
            if (x == gx && y == gy) {
                continue;
            }

            float best = cell.cost;
            int bestX = x;
            int bestY = y;
            for (int dir = 0; dir < 8; ++dir) {
                const int nx = x + DX8[dir];
                const int ny = y + DY8[dir];
                if (!field.inBounds(nx, ny) || !stepAllowed(x, y, dir)) {
                    continue;
                }
                const float c = field.m_cells[field.index(nx, ny)].cost;
                if (c < best) {
                    best = c;
                    bestX = nx;
                    bestY = ny;
                }
            }
            cell.direction = Vector2D(static_cast<float>(bestX - x), static_cast<float>(bestY - y)).normalized();
            if (bestX != x || bestY != y) {
                cell.nextX = bestX;
                cell.nextY = bestY;
            }
        }
    }

    PATHFIND_DEBUG("Flow field built " + std::to_string(field.m_width) + "x" + std::to_string(field.m_height) +
                   ", reachable cells: " + std::to_string(field.m_reachable));
    return field;
}

std::pair<int, int> FlowField::worldToCell(const Vector2D& pos) const {
    const double fx = std::floor((static_cast<double>(pos.getX()) - m_origin.getX()) / m_resolution);
    const double fy = std::floor((static_cast<double>(pos.getY()) - m_origin.getY()) / m_resolution);
    // Anything far outside maps to -1 so inBounds() rejects it without overflow
    auto clampIndex = [](double v) {
        return (!std::isfinite(v) || v < -1.0 || v > 1.0e9) ? -1 : static_cast<int>(v);
    };
    return {clampIndex(fx), clampIndex(fy)};
}

Vector2D FlowField::cellCenter(int gx, int gy) const {
    return Vector2D(m_origin.getX() + (static_cast<float>(gx) + 0.5f) * m_resolution,
                    m_origin.getY() + (static_cast<float>(gy) + 0.5f) * m_resolution);
}

const FlowFieldCell* FlowField::cellAt(int gx, int gy) const {
    if (!inBounds(gx, gy)) {
        return nullptr;
    }
    return &m_cells[index(gx, gy)];
}

const FlowFieldCell* FlowField::cellAtWorld(const Vector2D& pos) const {
    auto [gx, gy] = worldToCell(pos);
    return cellAt(gx, gy);
}

} // namespace HordeMind
