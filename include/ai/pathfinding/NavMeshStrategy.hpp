/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_MESH_STRATEGY_HPP
#define NAV_MESH_STRATEGY_HPP

#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <optional>
#include <vector>
#include "ai/pathfinding/PathfindingStrategy.hpp"

namespace HordeMind {

struct NavPolygon {
    std::vector<Vector2D> vertices;                          // Simple polygon, either winding
    boost::container::small_vector<size_t, 6> neighbors;     // Indices into the mesh
    std::optional<Vector2D> center;                          // Vertex centroid when unset
};

/**
 * @brief Polygon-graph routing over a loaded navigation mesh.
 *
 * Routes are breadth-first over polygon adjacency and pass through polygon
 * centres. Anything the mesh cannot answer (no mesh, endpoint outside every
 * polygon, disconnected polygons) is routed directly.
 */
class NavMeshStrategy : public IPathfindingStrategy {
public:
    NavMeshStrategy() = default;

    std::vector<Vector2D> findPath(const Vector2D& start, const Vector2D& goal) override;
    PathfindingAlgorithm getAlgorithm() const override { return PathfindingAlgorithm::NavMesh; }

    /**
     * @brief Replaces the mesh. Neighbour indices past the end are dropped.
     */
    void loadMesh(std::vector<NavPolygon> polygons);
    [[nodiscard]] bool hasMesh() const { return !m_polygons.empty(); }
    [[nodiscard]] size_t polygonCount() const { return m_polygons.size(); }

    // Index of the first polygon containing the point
    std::optional<size_t> findPolygon(const Vector2D& point) const;

    static bool containsPoint(const NavPolygon& polygon, const Vector2D& point);

private:
    std::vector<NavPolygon> m_polygons;
    std::vector<Vector2D> m_centers;
};

} // namespace HordeMind

#endif // NAV_MESH_STRATEGY_HPP
