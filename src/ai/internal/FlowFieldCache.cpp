/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/internal/FlowFieldCache.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "core/Logger.hpp"

namespace AIInternal {

FlowFieldCache::FlowFieldCache(size_t capacity)
    : m_capacity(std::max<size_t>(1, capacity))
{
}

std::shared_ptr<const HordeMind::FlowField> FlowFieldCache::find(uint64_t key)
{
    auto it = m_fields.find(key);
    if (it == m_fields.end()) {
        return nullptr;
    }
    return it->second.field;
}

void FlowFieldCache::store(uint64_t key, std::shared_ptr<const HordeMind::FlowField> field)
{
    if (!field) {
        return;
    }
    Entry entry;
    entry.field = std::move(field);
    entry.insertionTime = m_now;
    entry.sequence = m_nextSequence++;
    m_fields[key] = std::move(entry);
    ++m_stores;

    trimToCapacity();
}

size_t FlowFieldCache::trimToCapacity()
{
    if (m_fields.size() <= m_capacity) {
        return 0;
    }
    return evictOldestHalf();
}

size_t FlowFieldCache::evictOldestHalf()
{
    const size_t toRemove = m_fields.size() / 2;
    if (toRemove == 0) {
        return 0;
    }

    std::vector<std::pair<uint64_t, uint64_t>> order;  // (sequence, key)
    order.reserve(m_fields.size());
    for (const auto& [key, entry] : m_fields) {
        order.emplace_back(entry.sequence, key);
    }
    std::sort(order.begin(), order.end());
    for (size_t i = 0; i < toRemove; ++i) {
        m_fields.erase(order[i].second);
    }
    PATHFIND_DEBUG("FlowFieldCache evicted " + std::to_string(toRemove) + " oldest fields");
    return toRemove;
}

} // namespace AIInternal
