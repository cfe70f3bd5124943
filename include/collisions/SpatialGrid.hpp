/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

struct SpatialGridConfig {
    float cellSize = 100.0f;                  // World units per square cell, must be > 0
    Vector2D worldMin{-5000.0f, -5000.0f};    // Used to bound unlimited k-nearest searches
    Vector2D worldMax{5000.0f, 5000.0f};
};

struct SpatialGridStats {
    size_t entityCount{0};
    size_t cellCount{0};               // Occupied cells only
    float averageEntitiesPerCell{0.0f};
    size_t maxEntitiesPerCell{0};
};

/**
 * @brief Uniform grid over circles, keyed by quantized cell coordinates.
 *
 * Each entity is a (position, radius) circle and is listed in every cell its
 * bounding square overlaps. The grid stores ids and positions only; whoever
 * owns the entities is responsible for calling update() when they move.
 */
class SpatialGrid {
public:
    /**
     * @throws std::invalid_argument if cellSize is not positive or the world
     *         bounds are inverted
     */
    explicit SpatialGrid(const SpatialGridConfig& config = SpatialGridConfig{});

    /**
     * @brief Adds an entity. Re-inserting a tracked id replaces its entry.
     */
    void insert(EntityID id, const Vector2D& position, float radius = 0.0f);

    /**
     * @brief Moves a tracked entity, touching only cells it enters or leaves.
     *        Unknown ids are ignored.
     */
    void update(EntityID id, const Vector2D& newPosition);

    void remove(EntityID id);

    /**
     * @brief Ids whose circle intersects the query circle
     *        (distSq <= (radius + entityRadius)^2).
     */
    std::vector<EntityID> query(const Vector2D& position, float radius) const;
    void query(const Vector2D& position, float radius, std::vector<EntityID>& out) const;

    /**
     * @brief Up to k closest ids, nearest first.
     *
     * The search radius starts at one cell and doubles until k candidates are
     * found or maxRadius is reached.
     */
    std::vector<EntityID> kNearest(const Vector2D& position, size_t k,
                                   float maxRadius = std::numeric_limits<float>::infinity()) const;

    [[nodiscard]] bool contains(EntityID id) const { return m_entries.count(id) != 0; }
    [[nodiscard]] std::optional<Vector2D> getPosition(EntityID id) const;
    [[nodiscard]] size_t size() const { return m_entries.size(); }
    [[nodiscard]] float getCellSize() const { return m_cellSize; }
    [[nodiscard]] SpatialGridStats getStats() const;

    void clear();

private:
    struct CellCoord { int x; int y; };
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.y);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.y == b.y;
        }
    };

    struct CellRange {
        int minX{0}, minY{0}, maxX{-1}, maxY{-1};
        bool contains(int x, int y) const {
            return x >= minX && x <= maxX && y >= minY && y <= maxY;
        }
        bool operator==(const CellRange& o) const {
            return minX == o.minX && minY == o.minY && maxX == o.maxX && maxY == o.maxY;
        }
        int64_t cellCount() const {
            return static_cast<int64_t>(maxX - minX + 1) * static_cast<int64_t>(maxY - minY + 1);
        }
    };

    struct Entry {
        Vector2D position;
        float radius{0.0f};
        CellRange cells;
    };

    using CellVector = boost::container::small_vector<EntityID, 8>;

    float m_cellSize{100.0f};
    Vector2D m_worldMin;
    Vector2D m_worldMax;
    std::unordered_map<EntityID, Entry> m_entries;
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;

    CellRange rangeFor(const Vector2D& center, float radius) const;
    void addToCells(EntityID id, const CellRange& range, const CellRange* skip);
    void removeFromCells(EntityID id, const CellRange& range, const CellRange* skip);
    float unboundedSearchLimit(const Vector2D& position) const;
};

} // namespace HordeMind

#endif // SPATIAL_GRID_HPP
