/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOW_FIELD_CACHE_HPP
#define FLOW_FIELD_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include "ai/pathfinding/FlowField.hpp"

namespace AIInternal {

/**
 * Flow fields keyed by goal cell. Same eviction rule as PathCache: once over
 * capacity, the oldest half by insertion order is dropped.
 *
 * Fields are handed out as shared_ptr so a field in use by the current walk
 * survives an eviction triggered during that walk.
 */
class FlowFieldCache {
public:
    explicit FlowFieldCache(size_t capacity = DEFAULT_CAPACITY);

    static uint64_t makeKey(int goalCellX, int goalCellY) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(goalCellX)) << 32) |
               static_cast<uint32_t>(goalCellY);
    }

    std::shared_ptr<const HordeMind::FlowField> find(uint64_t key);
    void store(uint64_t key, std::shared_ptr<const HordeMind::FlowField> field);

    size_t trimToCapacity();
    size_t evictOldestHalf();

    void setCurrentTime(double nowMs) { m_now = nowMs; }

    void clear() { m_fields.clear(); }
    size_t size() const { return m_fields.size(); }
    size_t capacity() const { return m_capacity; }
    uint64_t getBuildCount() const { return m_stores; }

    static constexpr size_t DEFAULT_CAPACITY = 10;

private:
    struct Entry {
        std::shared_ptr<const HordeMind::FlowField> field;
        double insertionTime{0.0};
        uint64_t sequence{0};
    };

    std::unordered_map<uint64_t, Entry> m_fields;
    size_t m_capacity;
    double m_now{0.0};
    uint64_t m_nextSequence{0};
    uint64_t m_stores{0};
};

} // namespace AIInternal

#endif // FLOW_FIELD_CACHE_HPP
