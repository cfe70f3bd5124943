/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/NavigationGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace HordeMind {

NavigationGrid::NavigationGrid(int width, int height, float cellSize, const Vector2D& worldOffset)
    : m_w(width), m_h(height), m_cell(cellSize), m_offset(worldOffset) {
    if (m_w <= 0 || m_h <= 0) {
        throw std::invalid_argument("NavigationGrid dimensions must be positive: " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        throw std::invalid_argument("NavigationGrid cell size must be positive: " +
                                    std::to_string(cellSize));
    }
    m_blocked.assign(static_cast<size_t>(m_w) * static_cast<size_t>(m_h), 0);
}

NavigationGrid NavigationGrid::fromBounds(const Vector2D& worldMin, const Vector2D& worldMax, float cellSize) {
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument("NavigationGrid cell size must be positive: " +
                                    std::to_string(cellSize));
    }
    const int w = static_cast<int>(std::ceil((worldMax.getX() - worldMin.getX()) / cellSize));
    const int h = static_cast<int>(std::ceil((worldMax.getY() - worldMin.getY()) / cellSize));
    return NavigationGrid(w, h, cellSize, worldMin);
}

bool NavigationGrid::inBounds(int gx, int gy) const {
    return gx >= 0 && gy >= 0 && gx < m_w && gy < m_h;
}

bool NavigationGrid::isBlocked(int gx, int gy) const {
    if (!inBounds(gx, gy)) return false;
    return m_blocked[static_cast<size_t>(gy) * static_cast<size_t>(m_w) + static_cast<size_t>(gx)] != 0;
}

bool NavigationGrid::isWorldBlocked(const Vector2D& pos) const {
    if (m_blockedCount == 0) return false;
    auto [gx, gy] = worldToGrid(pos);
    return isBlocked(gx, gy);
}

std::pair<int, int> NavigationGrid::worldToGrid(const Vector2D& w) const {
    int gx = static_cast<int>(std::floor((w.getX() - m_offset.getX()) / m_cell));
    int gy = static_cast<int>(std::floor((w.getY() - m_offset.getY()) / m_cell));
    return {gx, gy};
}

Vector2D NavigationGrid::gridToWorld(int gx, int gy) const {
    float wx = m_offset.getX() + gx * m_cell + m_cell * 0.5f;
    float wy = m_offset.getY() + gy * m_cell + m_cell * 0.5f;
    return Vector2D(wx, wy);
}

void NavigationGrid::setBlocked(int gx, int gy, bool blocked) {
    if (!inBounds(gx, gy)) {
        PATHFIND_DEBUG("setBlocked ignored out of bounds cell " + std::to_string(gx) + "," + std::to_string(gy));
        return;
    }
    auto& cell = m_blocked[static_cast<size_t>(gy) * static_cast<size_t>(m_w) + static_cast<size_t>(gx)];
    const uint8_t value = blocked ? 1 : 0;
    if (cell == value) return;
    cell = value;
    if (blocked) {
        ++m_blockedCount;
    } else {
        --m_blockedCount;
    }
}

size_t NavigationGrid::setBlockedRect(const Vector2D& worldMin, const Vector2D& worldMax, bool blocked) {
    auto [ax, ay] = worldToGrid(worldMin);
    auto [bx, by] = worldToGrid(worldMax);
    int x0 = std::min(ax, bx);
    int x1 = std::max(ax, bx);
    int y0 = std::min(ay, by);
    int y1 = std::max(ay, by);
    if (x1 < 0 || y1 < 0 || x0 >= m_w || y0 >= m_h) {
        return 0;
    }
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, m_w - 1);
    y1 = std::min(y1, m_h - 1);

    const size_t before = m_blockedCount;
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            setBlocked(x, y, blocked);
        }
    }
    return blocked ? m_blockedCount - before : before - m_blockedCount;
}

void NavigationGrid::clearObstacles() {
    std::fill(m_blocked.begin(), m_blocked.end(), 0);
    m_blockedCount = 0;
}

} // namespace HordeMind
