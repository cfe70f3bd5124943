/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOW_FIELD_HPP
#define FLOW_FIELD_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>
#include "utils/Vector2D.hpp"

namespace HordeMind {

class NavigationGrid;

struct FlowFieldCell {
    Vector2D direction;   // Unit vector toward the cheapest neighbour, zero at the goal
    float cost{std::numeric_limits<float>::infinity()};  // Infinity when unreachable
    int nextX{-1};        // Cheapest neighbour cell, -1 at the goal or when unreachable
    int nextY{-1};
};

/**
 * @brief Direction/cost grid toward a single goal cell.
 *
 * Cells are `resolution` units square and laid out row-major from `origin`.
 * Diagonal moves require both orthogonal neighbours to be open, so neither
 * the cost wave nor the directions cut blocked corners.
 */
class FlowField {
public:
    static constexpr float UNREACHABLE = std::numeric_limits<float>::infinity();

    /**
     * @brief Runs the cost wave from the goal cell and derives directions.
     *
     * A goal outside the grid yields a field where every cell is unreachable.
     */
    static FlowField build(const Vector2D& goal, const Vector2D& worldMin, const Vector2D& worldMax,
                           float resolution, const NavigationGrid* obstacles = nullptr);

    [[nodiscard]] bool inBounds(int gx, int gy) const {
        return gx >= 0 && gy >= 0 && gx < m_width && gy < m_height;
    }
    std::pair<int, int> worldToCell(const Vector2D& pos) const;
    Vector2D cellCenter(int gx, int gy) const;

    // nullptr when out of bounds
    const FlowFieldCell* cellAt(int gx, int gy) const;
    const FlowFieldCell* cellAtWorld(const Vector2D& pos) const;

    [[nodiscard]] int getWidth() const { return m_width; }
    [[nodiscard]] int getHeight() const { return m_height; }
    [[nodiscard]] float getResolution() const { return m_resolution; }
    [[nodiscard]] const Vector2D& getGoal() const { return m_goal; }
    [[nodiscard]] std::pair<int, int> getGoalCell() const { return {m_goalX, m_goalY}; }
    [[nodiscard]] size_t reachableCells() const { return m_reachable; }

private:
    Vector2D m_origin;
    Vector2D m_goal;
    float m_resolution{32.0f};
    int m_width{0};
    int m_height{0};
    int m_goalX{0};
    int m_goalY{0};
    size_t m_reachable{0};
    std::vector<FlowFieldCell> m_cells;

    size_t index(int gx, int gy) const {
        return static_cast<size_t>(gy) * static_cast<size_t>(m_width) + static_cast<size_t>(gx);
    }
};

} // namespace HordeMind

#endif // FLOW_FIELD_HPP
