/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/NavMeshStrategy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <string>

namespace HordeMind {

namespace {

constexpr size_t NO_PARENT = std::numeric_limits<size_t>::max();

Vector2D centroid(const std::vector<Vector2D>& vertices) {
    Vector2D sum;
    for (const auto& v : vertices) {
        sum += v;
    }
    return vertices.empty() ? sum : sum / static_cast<float>(vertices.size());
}

} // namespace

void NavMeshStrategy::loadMesh(std::vector<NavPolygon> polygons) {
    m_polygons = std::move(polygons);
    m_centers.clear();
    m_centers.reserve(m_polygons.size());

    const size_t count = m_polygons.size();
    for (auto& poly : m_polygons) {
        auto& n = poly.neighbors;
        n.erase(std::remove_if(n.begin(), n.end(), [count](size_t idx) { return idx >= count; }), n.end());
        m_centers.push_back(poly.center ? *poly.center : centroid(poly.vertices));
    }
    PATHFIND_INFO("NavMesh loaded with " + std::to_string(count) + " polygons");
}

bool NavMeshStrategy::containsPoint(const NavPolygon& polygon, const Vector2D& point) {
    const auto& v = polygon.vertices;
    if (v.size() < 3) {
        return false;
    }
    const float px = point.getX();
    const float py = point.getY();
    bool inside = false;
    for (size_t i = 0, j = v.size() - 1; i < v.size(); j = i++) {
        const float xi = v[i].getX(), yi = v[i].getY();
        const float xj = v[j].getX(), yj = v[j].getY();
        if ((yi > py) != (yj > py) && px < (xj - xi) * (py - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }
    return inside;
}

std::optional<size_t> NavMeshStrategy::findPolygon(const Vector2D& point) const {
    for (size_t i = 0; i < m_polygons.size(); ++i) {
        if (containsPoint(m_polygons[i], point)) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<Vector2D> NavMeshStrategy::findPath(const Vector2D& start, const Vector2D& goal) {
    if (m_polygons.empty()) {
        return DirectStrategy::interpolate(start, goal);
    }
    const auto startPoly = findPolygon(start);
    const auto goalPoly = findPolygon(goal);
    if (!startPoly || !goalPoly) {
        PATHFIND_DEBUG("NavMesh endpoint outside mesh, using direct path");
        return DirectStrategy::interpolate(start, goal);
    }
    if (*startPoly == *goalPoly) {
        return {start, goal};
    }

    std::vector<size_t> parent(m_polygons.size(), NO_PARENT);
    std::vector<char> visited(m_polygons.size(), 0);
    std::deque<size_t> frontier;
    frontier.push_back(*startPoly);
    visited[*startPoly] = 1;

    bool found = false;
    while (!frontier.empty() && !found) {
        const size_t current = frontier.front();
        frontier.pop_front();
        for (size_t next : m_polygons[current].neighbors) {
            if (visited[next]) {
                continue;
            }
            visited[next] = 1;
            parent[next] = current;
            if (next == *goalPoly) {
                found = true;
                break;
            }
            frontier.push_back(next);
        }
    }

    if (!found) {
        PATHFIND_DEBUG("NavMesh polygons not connected, using direct path");
        return DirectStrategy::interpolate(start, goal);
    }

    std::vector<Vector2D> path;
    path.push_back(goal);
    for (size_t poly = parent[*goalPoly]; poly != *startPoly; poly = parent[poly]) {
        path.push_back(m_centers[poly]);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace HordeMind
