/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/internal/PathCache.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

#include "core/Logger.hpp"

namespace AIInternal {

namespace {

int32_t quantize(float coord, float cell) {
    double q = std::floor(static_cast<double>(coord) / static_cast<double>(cell));
    q = std::clamp(q, -2147483000.0, 2147483000.0);
    return static_cast<int32_t>(q);
}

} // namespace

PathCache::PathCache(size_t capacity, float quantization)
    : m_capacity(std::max<size_t>(1, capacity)),
      m_quantization(quantization > 0.0f ? quantization : DEFAULT_QUANTIZATION)
{
    m_paths.reserve(m_capacity + 1);
}

PathCacheKey PathCache::makeKey(const Vector2D& start, const Vector2D& goal) const
{
    return PathCacheKey{quantize(start.getX(), m_quantization), quantize(start.getY(), m_quantization),
                        quantize(goal.getX(), m_quantization), quantize(goal.getY(), m_quantization)};
}

std::optional<std::vector<Vector2D>> PathCache::find(const Vector2D& start, const Vector2D& goal)
{
    ++m_totalQueries;
    auto it = m_paths.find(makeKey(start, goal));
    if (it == m_paths.end()) {
        ++m_totalMisses;
        return std::nullopt;
    }
    ++m_totalHits;
    ++it->second.useCount;
    return it->second.waypoints;
}

void PathCache::store(const Vector2D& start, const Vector2D& goal, std::vector<Vector2D> waypoints)
{
    if (waypoints.empty()) {
        return;
    }

    CachedPath entry;
    entry.waypoints = std::move(waypoints);
    entry.insertionTime = m_now;
    entry.sequence = m_nextSequence++;
    entry.useCount = 0;
    m_paths[makeKey(start, goal)] = std::move(entry);

    trimToCapacity();
}

size_t PathCache::trimToCapacity()
{
    if (m_paths.size() <= m_capacity) {
        return 0;
    }
    return evictOldestHalf();
}

size_t PathCache::evictOldestHalf()
{
    const size_t toRemove = m_paths.size() / 2;
    if (toRemove == 0) {
        return 0;
    }

    std::vector<std::pair<uint64_t, PathCacheKey>> order;
    order.reserve(m_paths.size());
    for (const auto& [key, entry] : m_paths) {
        order.emplace_back(entry.sequence, key);
    }
    std::nth_element(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(toRemove), order.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 0; i < toRemove; ++i) {
        m_paths.erase(order[i].second);
    }
    m_evictedPaths += toRemove;
    PATHFIND_DEBUG("PathCache evicted " + std::to_string(toRemove) + " oldest paths");
    return toRemove;
}

PathCacheStats PathCache::getStats() const
{
    PathCacheStats stats;
    stats.totalPaths = m_paths.size();
    stats.totalQueries = m_totalQueries;
    stats.totalHits = m_totalHits;
    stats.totalMisses = m_totalMisses;
    stats.evictedPaths = m_evictedPaths;
    stats.updateHitRate();
    return stats;
}

void PathCache::resetStats()
{
    m_totalQueries = 0;
    m_totalHits = 0;
    m_totalMisses = 0;
    m_evictedPaths = 0;
}

void PathCache::clear()
{
    m_paths.clear();
}

} // namespace AIInternal
