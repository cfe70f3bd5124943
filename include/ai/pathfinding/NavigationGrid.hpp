/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_GRID_HPP
#define NAVIGATION_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "utils/Vector2D.hpp"

namespace HordeMind {

/**
 * @brief Static obstacle layer shared by the grid-based strategies.
 *
 * Cells outside the grid carry no obstacle data and are reported as open, so
 * the unbounded A* lattice can still search past the mapped area.
 */
class NavigationGrid {
public:
    /**
     * @throws std::invalid_argument on non-positive dimensions or cell size
     */
    NavigationGrid(int width, int height, float cellSize, const Vector2D& worldOffset);

    /**
     * @brief Grid covering [worldMin, worldMax] at the given cell size.
     */
    static NavigationGrid fromBounds(const Vector2D& worldMin, const Vector2D& worldMax, float cellSize);

    void setBlocked(int gx, int gy, bool blocked);

    /**
     * @brief Marks every cell overlapping the world-space rectangle.
     * @return Number of cells whose state changed
     */
    size_t setBlockedRect(const Vector2D& worldMin, const Vector2D& worldMax, bool blocked);

    [[nodiscard]] bool isBlocked(int gx, int gy) const;
    [[nodiscard]] bool isWorldBlocked(const Vector2D& pos) const;
    [[nodiscard]] bool inBounds(int gx, int gy) const;

    std::pair<int, int> worldToGrid(const Vector2D& w) const;
    Vector2D gridToWorld(int gx, int gy) const;

    void clearObstacles();
    [[nodiscard]] size_t blockedCount() const { return m_blockedCount; }

    [[nodiscard]] float getCellSize() const { return m_cell; }
    [[nodiscard]] int getWidth() const { return m_w; }
    [[nodiscard]] int getHeight() const { return m_h; }
    [[nodiscard]] Vector2D getWorldOffset() const { return m_offset; }

private:
    int m_w;
    int m_h;
    float m_cell;
    Vector2D m_offset;
    std::vector<uint8_t> m_blocked; // 0 walkable, 1 blocked
    size_t m_blockedCount{0};
};

} // namespace HordeMind

#endif // NAVIGATION_GRID_HPP
