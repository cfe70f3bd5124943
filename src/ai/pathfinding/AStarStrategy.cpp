/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/AStarStrategy.hpp"
#include "ai/pathfinding/NavigationGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace HordeMind {

namespace {

constexpr float COST_STRAIGHT = 1.0f;
constexpr float COST_DIAGONAL = 1.41421356f;

constexpr int DX8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int DY8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

struct OpenNode {
    int x;
    int y;
    float f;
    float g;
};

// Min-heap on f; on ties prefer the deeper node so straight runs finish sooner
struct OpenNodeCmp {
    bool operator()(const OpenNode& a, const OpenNode& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.g < b.g;
    }
};

uint64_t packNode(int x, int y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
}

int unpackX(uint64_t key) { return static_cast<int32_t>(static_cast<uint32_t>(key >> 32)); }
int unpackY(uint64_t key) { return static_cast<int32_t>(static_cast<uint32_t>(key & 0xffffffffu)); }

} // namespace

AStarStrategy::AStarStrategy(const GridSearchSettings& settings, const NavigationGrid* obstacles)
    : m_settings(settings), m_obstacles(obstacles) {
    if (!(m_settings.cellSize > 0.0f)) {
        m_settings.cellSize = GridSearchSettings{}.cellSize;
    }
    if (m_settings.maxSearchNodes == 0) {
        m_settings.maxSearchNodes = GridSearchSettings{}.maxSearchNodes;
    }
    m_settings.heuristicWeight = std::max(0.0f, m_settings.heuristicWeight);
}

std::vector<Vector2D> AStarStrategy::findPath(const Vector2D& start, const Vector2D& goal) {
    m_lastStats = GridSearchStats{};
    const float cell = m_settings.cellSize;

    if (!std::isfinite(Vector2D::distanceSquared(start, goal))) {
        m_lastStats.usedFallback = true;
        return DirectStrategy::interpolate(start, goal);
    }

    auto nodeWorld = [&](int x, int y) {
        return Vector2D(start.getX() + static_cast<float>(x) * cell,
                        start.getY() + static_cast<float>(y) * cell);
    };
    auto heuristic = [&](int x, int y) {
        return Vector2D::distance(nodeWorld(x, y), goal) / cell;
    };

    std::priority_queue<OpenNode, std::vector<OpenNode>, OpenNodeCmp> open;
    std::unordered_map<uint64_t, float> gScore;
    std::unordered_map<uint64_t, uint64_t> parent;
    std::unordered_set<uint64_t> closed;

    const uint64_t origin = packNode(0, 0);
    gScore[origin] = 0.0f;
    open.push(OpenNode{0, 0, m_settings.heuristicWeight * heuristic(0, 0), 0.0f});

    while (!open.empty()) {
        const OpenNode current = open.top();
        open.pop();

        const uint64_t key = packNode(current.x, current.y);
        if (!closed.insert(key).second) {
            continue;  // Stale duplicate
        }
        m_lastStats.nodesExpanded = closed.size();

        if (closed.size() > m_settings.maxSearchNodes) {
            PATHFIND_DEBUG("Grid search exceeded " + std::to_string(m_settings.maxSearchNodes) +
                           " nodes, using direct path");
            m_lastStats.nodesExpanded = m_settings.maxSearchNodes;
            m_lastStats.usedFallback = true;
            return DirectStrategy::interpolate(start, goal);
        }

        if (Vector2D::distance(nodeWorld(current.x, current.y), goal) < cell) {
            std::vector<Vector2D> path;
            uint64_t walk = key;
            path.push_back(nodeWorld(current.x, current.y));
            while (walk != origin) {
                walk = parent.at(walk);
                path.push_back(nodeWorld(unpackX(walk), unpackY(walk)));
            }
            std::reverse(path.begin(), path.end());
            if (path.back() != goal) {
                path.push_back(goal);
            }
            return path;
        }

        for (int dir = 0; dir < 8; ++dir) {
            const int nx = current.x + DX8[dir];
            const int ny = current.y + DY8[dir];
            const uint64_t nkey = packNode(nx, ny);
            if (closed.count(nkey) != 0) {
                continue;
            }
            if (m_obstacles && m_obstacles->isWorldBlocked(nodeWorld(nx, ny))) {
                continue;
            }
            // No corner cutting: both orthogonal neighbours must be open
            if (m_obstacles && dir >= 4 &&
                (m_obstacles->isWorldBlocked(nodeWorld(nx, current.y)) ||
                 m_obstacles->isWorldBlocked(nodeWorld(current.x, ny)))) {
                continue;
            }

            const float stepCost = (dir < 4) ? COST_STRAIGHT : COST_DIAGONAL;
            const float tentative = current.g + stepCost;
            auto it = gScore.find(nkey);
            if (it != gScore.end() && tentative >= it->second) {
                continue;
            }
            gScore[nkey] = tentative;
            parent[nkey] = key;
            open.push(OpenNode{nx, ny, tentative + m_settings.heuristicWeight * heuristic(nx, ny), tentative});
        }
    }

    PATHFIND_DEBUG("Grid search exhausted without reaching goal, using direct path");
    m_lastStats.usedFallback = true;
    return DirectStrategy::interpolate(start, goal);
}

DijkstraStrategy::DijkstraStrategy(const GridSearchSettings& settings, const NavigationGrid* obstacles)
    : AStarStrategy(settings, obstacles) {
    m_settings.heuristicWeight = 0.0f;
}

} // namespace HordeMind
