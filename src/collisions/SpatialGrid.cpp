/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace HordeMind {

namespace {

// Keeps huge or infinite radii from overflowing the integer cell index
constexpr double CELL_INDEX_LIMIT = 1.0e9;

int toCellIndex(float worldCoord, float cellSize) {
    double q = std::floor(static_cast<double>(worldCoord) / static_cast<double>(cellSize));
    q = std::clamp(q, -CELL_INDEX_LIMIT, CELL_INDEX_LIMIT);
    return static_cast<int>(q);
}

} // namespace

SpatialGrid::SpatialGrid(const SpatialGridConfig& config)
    : m_cellSize(config.cellSize), m_worldMin(config.worldMin), m_worldMax(config.worldMax) {
    if (!(m_cellSize > 0.0f) || !std::isfinite(m_cellSize)) {
        throw std::invalid_argument("SpatialGrid cell size must be positive: " +
                                    std::to_string(config.cellSize));
    }
    if (m_worldMax.getX() < m_worldMin.getX() || m_worldMax.getY() < m_worldMin.getY()) {
        throw std::invalid_argument("SpatialGrid world bounds are inverted");
    }
}

SpatialGrid::CellRange SpatialGrid::rangeFor(const Vector2D& center, float radius) const {
    const float r = std::max(0.0f, radius);
    CellRange range;
    range.minX = toCellIndex(center.getX() - r, m_cellSize);
    range.maxX = toCellIndex(center.getX() + r, m_cellSize);
    range.minY = toCellIndex(center.getY() - r, m_cellSize);
    range.maxY = toCellIndex(center.getY() + r, m_cellSize);
    return range;
}

void SpatialGrid::addToCells(EntityID id, const CellRange& range, const CellRange* skip) {
    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            if (skip && skip->contains(x, y)) {
                continue;
            }
            m_cells[CellCoord{x, y}].push_back(id);
        }
    }
}

void SpatialGrid::removeFromCells(EntityID id, const CellRange& range, const CellRange* skip) {
    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            if (skip && skip->contains(x, y)) {
                continue;
            }
            auto cit = m_cells.find(CellCoord{x, y});
            if (cit == m_cells.end()) {
                continue;
            }
            auto& ids = cit->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty()) {
                m_cells.erase(cit);
            }
        }
    }
}

void SpatialGrid::insert(EntityID id, const Vector2D& position, float radius) {
    auto it = m_entries.find(id);
    if (it != m_entries.end()) {
        removeFromCells(id, it->second.cells, nullptr);
        m_entries.erase(it);
    }

    Entry entry;
    entry.position = position;
    entry.radius = std::max(0.0f, radius);
    entry.cells = rangeFor(position, entry.radius);
    addToCells(id, entry.cells, nullptr);
    m_entries.emplace(id, entry);
}

void SpatialGrid::update(EntityID id, const Vector2D& newPosition) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return;
    }

    Entry& entry = it->second;
    const CellRange oldCells = entry.cells;
    const CellRange newCells = rangeFor(newPosition, entry.radius);
    entry.position = newPosition;
    if (oldCells == newCells) {
        return;
    }

    removeFromCells(id, oldCells, &newCells);
    addToCells(id, newCells, &oldCells);
    entry.cells = newCells;
}

void SpatialGrid::remove(EntityID id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return;
    }
    removeFromCells(id, it->second.cells, nullptr);
    m_entries.erase(it);
}

std::vector<EntityID> SpatialGrid::query(const Vector2D& position, float radius) const {
    std::vector<EntityID> out;
    query(position, radius, out);
    return out;
}

void SpatialGrid::query(const Vector2D& position, float radius, std::vector<EntityID>& out) const {
    out.clear();
    if (m_entries.empty() || radius < 0.0f) {
        return;
    }

    std::unordered_set<EntityID> seen;
    auto consider = [&](const CellVector& ids) {
        for (EntityID id : ids) {
            if (!seen.insert(id).second) {
                continue;
            }
            const Entry& entry = m_entries.at(id);
            const float reach = radius + entry.radius;
            if (Vector2D::distanceSquared(entry.position, position) <= reach * reach) {
                out.push_back(id);
            }
        }
    };

    const CellRange range = rangeFor(position, radius);
    if (range.cellCount() > static_cast<int64_t>(m_cells.size())) {
        // Search area spans more cells than are occupied: walk the occupied ones
        for (const auto& [coord, ids] : m_cells) {
            if (range.contains(coord.x, coord.y)) {
                consider(ids);
            }
        }
        return;
    }

    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            auto cit = m_cells.find(CellCoord{x, y});
            if (cit != m_cells.end()) {
                consider(cit->second);
            }
        }
    }
}

float SpatialGrid::unboundedSearchLimit(const Vector2D& position) const {
    float farthest = 0.0f;
    const Vector2D corners[4] = {m_worldMin, m_worldMax,
                                 Vector2D(m_worldMin.getX(), m_worldMax.getY()),
                                 Vector2D(m_worldMax.getX(), m_worldMin.getY())};
    for (const Vector2D& corner : corners) {
        farthest = std::max(farthest, Vector2D::distance(position, corner));
    }
    return std::max(farthest, m_cellSize);
}

std::vector<EntityID> SpatialGrid::kNearest(const Vector2D& position, size_t k, float maxRadius) const {
    if (k == 0 || m_entries.empty() || maxRadius < 0.0f) {
        return {};
    }

    const float limit = std::isfinite(maxRadius) ? maxRadius : unboundedSearchLimit(position);
    float searchRadius = std::min(m_cellSize, limit);
    std::vector<EntityID> candidates;
    for (;;) {
        query(position, searchRadius, candidates);
        if (candidates.size() >= k || searchRadius >= limit ||
            candidates.size() == m_entries.size()) {
            break;
        }
        searchRadius = std::min(searchRadius * 2.0f, limit);
    }

    std::sort(candidates.begin(), candidates.end(), [&](EntityID a, EntityID b) {
        const float da = Vector2D::distanceSquared(m_entries.at(a).position, position);
        const float db = Vector2D::distanceSquared(m_entries.at(b).position, position);
        return da < db || (da == db && a < b);
    });
    if (candidates.size() > k) {
        candidates.resize(k);
    }
    return candidates;
}

std::optional<Vector2D> SpatialGrid::getPosition(EntityID id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

SpatialGridStats SpatialGrid::getStats() const {
    SpatialGridStats stats;
    stats.entityCount = m_entries.size();
    stats.cellCount = m_cells.size();
    size_t total = 0;
    for (const auto& [coord, ids] : m_cells) {
        total += ids.size();
        stats.maxEntitiesPerCell = std::max(stats.maxEntitiesPerCell, ids.size());
    }
    if (stats.cellCount > 0) {
        stats.averageEntitiesPerCell = static_cast<float>(total) / static_cast<float>(stats.cellCount);
    }
    return stats;
}

void SpatialGrid::clear() {
    SPATIAL_DEBUG("Clearing " + std::to_string(m_entries.size()) + " entities");
    m_cells.clear();
    m_entries.clear();
}

} // namespace HordeMind
