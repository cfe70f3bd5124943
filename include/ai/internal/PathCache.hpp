/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_CACHE_HPP
#define PATH_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "utils/Vector2D.hpp"

namespace AIInternal {

/**
 * Quantized (start cell, goal cell) pair. Two requests whose endpoints fall in
 * the same cells share one cache entry.
 */
struct PathCacheKey {
    int32_t startX{0};
    int32_t startY{0};
    int32_t goalX{0};
    int32_t goalY{0};

    bool operator==(const PathCacheKey& o) const {
        return startX == o.startX && startY == o.startY && goalX == o.goalX && goalY == o.goalY;
    }
};

struct PathCacheKeyHash {
    size_t operator()(const PathCacheKey& k) const noexcept {
        uint64_t h = 1469598103934665603ull;
        for (int32_t v : {k.startX, k.startY, k.goalX, k.goalY}) {
            h ^= static_cast<uint32_t>(v);
            h *= 1099511628211ull;
        }
        return static_cast<size_t>(h);
    }
};

/**
 * Cached waypoint list with the bookkeeping used for eviction.
 */
struct CachedPath {
    std::vector<Vector2D> waypoints;
    double insertionTime{0.0};   // Cache clock (ms) when stored
    uint64_t sequence{0};        // Insertion order, lower is older
    uint32_t useCount{0};
};

struct PathCacheStats {
    size_t totalPaths = 0;
    size_t totalQueries = 0;
    size_t totalHits = 0;
    size_t totalMisses = 0;
    size_t evictedPaths = 0;
    float hitRate = 0.0f;

    void updateHitRate() {
        hitRate = (totalQueries > 0) ? (static_cast<float>(totalHits) / static_cast<float>(totalQueries)) : 0.0f;
    }
};

/**
 * PathCache - memoizes computed paths by quantized start/goal.
 *
 * Bounded: once more than `capacity` entries are stored the oldest half (by
 * insertion order) is dropped in one pass. Owned by AIManager and mutated only
 * during its tick.
 */
class PathCache {
public:
    /**
     * @param capacity Maximum entries kept before the oldest half is evicted
     * @param quantization Cell size (world units) used to build keys
     */
    explicit PathCache(size_t capacity = DEFAULT_CAPACITY, float quantization = DEFAULT_QUANTIZATION);

    /**
     * Look up the path for a request. Counts a hit or a miss.
     *
     * @return Copy of the cached waypoints, or nullopt on a miss
     */
    std::optional<std::vector<Vector2D>> find(const Vector2D& start, const Vector2D& goal);

    /**
     * Store a path under the request's key, replacing any previous entry.
     * Empty paths are not cached.
     */
    void store(const Vector2D& start, const Vector2D& goal, std::vector<Vector2D> waypoints);

    /**
     * Evict the oldest half when over capacity.
     * @return Number of entries removed
     */
    size_t trimToCapacity();

    /**
     * Unconditionally evict the oldest half of the entries.
     * @return Number of entries removed
     */
    size_t evictOldestHalf();

    // Timestamp applied to subsequently stored entries
    void setCurrentTime(double nowMs) { m_now = nowMs; }

    PathCacheKey makeKey(const Vector2D& start, const Vector2D& goal) const;

    PathCacheStats getStats() const;
    void resetStats();
    void clear();
    size_t size() const { return m_paths.size(); }
    size_t capacity() const { return m_capacity; }

    static constexpr size_t DEFAULT_CAPACITY = 100;
    static constexpr float DEFAULT_QUANTIZATION = 50.0f;

private:
    std::unordered_map<PathCacheKey, CachedPath, PathCacheKeyHash> m_paths;
    size_t m_capacity;
    float m_quantization;
    double m_now{0.0};
    uint64_t m_nextSequence{0};

    size_t m_totalQueries{0};
    size_t m_totalHits{0};
    size_t m_totalMisses{0};
    size_t m_evictedPaths{0};
};

} // namespace AIInternal

#endif // PATH_CACHE_HPP
