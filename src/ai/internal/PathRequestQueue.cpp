/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/internal/PathRequestQueue.hpp"
#include "core/Logger.hpp"
#include <string>

namespace AIInternal {

PathRequestQueue::PathRequestQueue(size_t capacity)
    : m_capacity(capacity > 0 ? capacity : DEFAULT_CAPACITY) {}

EnqueueResult PathRequestQueue::enqueue(HordeMind::EntityID agentId, const Vector2D& goal, double nowMs) {
    auto it = m_pending.find(agentId);
    if (it != m_pending.end()) {
        it->second.request.goal = goal;
        it->second.request.enqueueTime = nowMs;
        return EnqueueResult::Updated;
    }

    if (m_pending.size() >= m_capacity) {
        ++m_rejected;
        PATHFIND_WARN("Path request queue full (" + std::to_string(m_capacity) +
                      "), dropping request for entity " + std::to_string(agentId));
        return EnqueueResult::Rejected;
    }

    if (m_order.size() >= m_capacity * 2) {
        compact();
    }

    const uint64_t seq = m_nextSequence++;
    m_pending.emplace(agentId, Pending{PathRequest{agentId, goal, nowMs}, seq});
    m_order.push_back(Slot{agentId, seq});
    return EnqueueResult::Queued;
}

bool PathRequestQueue::cancel(HordeMind::EntityID agentId) {
    // The slot in m_order goes stale and is discarded on drain
    return m_pending.erase(agentId) != 0;
}

size_t PathRequestQueue::drain(size_t budget, const Handler& handler) {
    size_t served = 0;
    while (served < budget && !m_order.empty()) {
        const Slot slot = m_order.front();
        m_order.pop_front();

        auto it = m_pending.find(slot.agentId);
        if (it == m_pending.end() || it->second.sequence != slot.sequence) {
            continue;
        }
        const PathRequest request = it->second.request;
        m_pending.erase(it);

        if (handler(request)) {
            ++served;
        }
    }

    // Only stale slots can remain once every live request is gone
    if (m_pending.empty()) {
        m_order.clear();
    }
    return served;
}

void PathRequestQueue::compact() {
    std::deque<Slot> live;
    for (const Slot& slot : m_order) {
        auto it = m_pending.find(slot.agentId);
        if (it != m_pending.end() && it->second.sequence == slot.sequence) {
            live.push_back(slot);
        }
    }
    m_order.swap(live);
}

void PathRequestQueue::clear() {
    m_order.clear();
    m_pending.clear();
}

} // namespace AIInternal
